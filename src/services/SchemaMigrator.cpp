#include "services/SchemaMigrator.hpp"
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QDebug>

#include "log/lanwatch_logging.hpp"

namespace {

bool execAll(QSqlDatabase& db, const QStringList& statements, QString* error)
{
	QSqlQuery q(db);
	for (const QString& sql : statements) {
		if (!q.exec(sql)) {
			if (error) *error = QStringLiteral("%1: %2").arg(sql.left(60), q.lastError().text());
			return false;
		}
	}
	return true;
}

bool addColumnIfMissing(QSqlDatabase& db, const QString& table, const QString& column,
						const QString& definition, QString* error)
{
	if (SchemaMigrator::hasColumn(db, table, column)) {
		qCDebug(LC_STORE) << "[migrate]" << table << "." << column << "already present";
		return true;
	}
	return execAll(db, { QStringLiteral("ALTER TABLE %1 ADD COLUMN %2 %3").arg(table, column, definition) }, error);
}

// v1: layout of the first release (no notes, no online streak)
bool createBaseTables(QSqlDatabase& db, QString* error)
{
	return execAll(db, {
		"CREATE TABLE IF NOT EXISTS devices ("
		"id INTEGER PRIMARY KEY AUTOINCREMENT, "
		"ip TEXT UNIQUE NOT NULL, "
		"mac TEXT NOT NULL, "
		"hostname TEXT, "
		"first_seen TEXT NOT NULL, "
		"last_seen TEXT NOT NULL, "
		"last_seen_online TEXT, "
		"total_scans INTEGER DEFAULT 0, "
		"scans_seen_online INTEGER DEFAULT 0, "
		"scans_seen_offline INTEGER DEFAULT 0, "
		"consecutive_offline INTEGER DEFAULT 0, "
		"created_at TEXT NOT NULL, "
		"updated_at TEXT NOT NULL)",
		"CREATE INDEX IF NOT EXISTS idx_devices_ip ON devices(ip)",
		"CREATE TABLE IF NOT EXISTS scans ("
		"id INTEGER PRIMARY KEY AUTOINCREMENT, "
		"scan_time TEXT NOT NULL, "
		"devices_found INTEGER DEFAULT 0, "
		"scan_method TEXT)"
	}, error);
}

bool addNotesColumn(QSqlDatabase& db, QString* error)
{
	return addColumnIfMissing(db, "devices", "notes", "TEXT DEFAULT ''", error);
}

bool addOnlineStreakColumn(QSqlDatabase& db, QString* error)
{
	return addColumnIfMissing(db, "devices", "consecutive_online", "INTEGER DEFAULT 0", error);
}

bool createCategorizationLog(QSqlDatabase& db, QString* error)
{
	return execAll(db, {
		"CREATE TABLE IF NOT EXISTS categorization_log ("
		"id INTEGER PRIMARY KEY AUTOINCREMENT, "
		"scan_id INTEGER, "
		"ip TEXT NOT NULL, "
		"total_scans INTEGER NOT NULL, "
		"scans_seen_online INTEGER NOT NULL, "
		"consecutive_online INTEGER NOT NULL, "
		"consecutive_offline INTEGER NOT NULL, "
		"appearance_rate REAL NOT NULL, "
		"category TEXT NOT NULL, "
		"online INTEGER NOT NULL, "
		"reason TEXT NOT NULL, "
		"logged_at TEXT NOT NULL)",
		"CREATE INDEX IF NOT EXISTS idx_catlog_scan ON categorization_log(scan_id)",
		"CREATE INDEX IF NOT EXISTS idx_catlog_ip   ON categorization_log(ip)"
	}, error);
}

bool createSystemLogs(QSqlDatabase& db, QString* error)
{
	return execAll(db, {
		"CREATE TABLE IF NOT EXISTS system_logs ("
		"id INTEGER PRIMARY KEY AUTOINCREMENT, "
		"level INTEGER NOT NULL, "
		"tag TEXT, "
		"message TEXT NOT NULL, "
		"timestamp TEXT NOT NULL, "
		"extra TEXT)",
		"CREATE INDEX IF NOT EXISTS idx_sys_ts    ON system_logs(timestamp)",
		"CREATE INDEX IF NOT EXISTS idx_sys_level ON system_logs(level)",
		"CREATE INDEX IF NOT EXISTS idx_sys_tag   ON system_logs(tag)"
	}, error);
}

} // namespace

const std::vector<MigrationStep>& SchemaMigrator::steps()
{
	static const std::vector<MigrationStep> s_steps = {
		{ 1, "create devices and scans",          createBaseTables },
		{ 2, "add devices.notes",                 addNotesColumn },
		{ 3, "add devices.consecutive_online",    addOnlineStreakColumn },
		{ 4, "create categorization_log",         createCategorizationLog },
		{ 5, "create system_logs",                createSystemLogs },
	};
	return s_steps;
}

int SchemaMigrator::latestVersion()
{
	return steps().empty() ? 0 : steps().back().version;
}

int SchemaMigrator::currentVersion() const
{
	QSqlQuery q(db_);
	if (!q.exec(QStringLiteral("PRAGMA user_version")) || !q.next()) {
		qCWarning(LC_STORE) << "[currentVersion] PRAGMA user_version failed:" << q.lastError().text();
		return -1;
	}
	return q.value(0).toInt();
}

bool SchemaMigrator::setVersion(int version, QString* error)
{
	// PRAGMA does not accept bound parameters
	QSqlQuery q(db_);
	if (!q.exec(QStringLiteral("PRAGMA user_version = %1").arg(version))) {
		if (error) *error = q.lastError().text();
		return false;
	}
	return true;
}

bool SchemaMigrator::applyStep(const MigrationStep& step, QString* error)
{
	if (!db_.transaction()) {
		if (error) *error = db_.lastError().text();
		return false;
	}

	QString why;
	if (!step.apply || !step.apply(db_, &why) || !setVersion(step.version, &why)) {
		db_.rollback();
		qCCritical(LC_STORE) << "[applyStep] v" << step.version << step.name << "failed:" << why;
		if (error) *error = QStringLiteral("migration %1 (%2) failed: %3").arg(step.version).arg(QString::fromUtf8(step.name), why);
		return false;
	}

	if (!db_.commit()) {
		if (error) *error = db_.lastError().text();
		db_.rollback();
		return false;
	}
	qCInfo(LC_STORE) << "[applyStep] schema now at v" << step.version << "-" << step.name;
	return true;
}

bool SchemaMigrator::migrate(QString* error)
{
	const int from = currentVersion();
	if (from < 0) {
		if (error) *error = QStringLiteral("cannot read schema version");
		return false;
	}

	for (const MigrationStep& step : steps()) {
		if (step.version <= from) continue;
		if (!applyStep(step, error)) return false;
	}

	if (from == latestVersion()) {
		qCDebug(LC_STORE) << "[migrate] schema up to date at v" << from;
	}
	return true;
}

bool SchemaMigrator::tableExists(QSqlDatabase& db, const QString& table)
{
	QSqlQuery q(db);
	q.prepare(QStringLiteral("SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?"));
	q.addBindValue(table);
	return q.exec() && q.next() && q.value(0).toInt() > 0;
}

bool SchemaMigrator::hasColumn(QSqlDatabase& db, const QString& table, const QString& column)
{
	QSqlQuery q(db);
	if (!q.exec(QStringLiteral("PRAGMA table_info(%1)").arg(table))) return false;
	while (q.next()) {
		// cid, name, type, notnull, dflt_value, pk
		if (q.value(1).toString().compare(column, Qt::CaseInsensitive) == 0) return true;
	}
	return false;
}
