#include "QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include "services/SchemaMigrator.hpp"
#include <QSqlDriver>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QMutexLocker>
#include <QThread>
#include <QDebug>

#include "include/scan_params.hpp"
#include "log/lanwatch_logging.hpp"

using namespace SqlCommon;

namespace {

const char* kDeviceColumns =
	"id, ip, mac, hostname, notes, first_seen, last_seen, last_seen_online, "
	"total_scans, scans_seen_online, scans_seen_offline, consecutive_offline, consecutive_online";

Device rowToDevice(const QSqlQuery& q)
{
	Device d;
	d.id                 = q.value(0).toLongLong();
	d.address            = q.value(1).toString();
	d.hardwareId         = q.value(2).toString();
	d.label              = q.value(3).isNull() ? QStringLiteral("Unknown") : q.value(3).toString();
	d.notes              = q.value(4).toString();
	d.firstSeen          = fromDbTime(q.value(5));
	d.lastSeen           = fromDbTime(q.value(6));
	d.lastSeenOnline     = fromDbTime(q.value(7));
	d.totalScans         = q.value(8).toInt();
	d.scansSeenOnline    = q.value(9).toInt();
	d.scansSeenOffline   = q.value(10).toInt();
	d.consecutiveOffline = q.value(11).toInt();
	d.consecutiveOnline  = q.value(12).toInt();
	return d;
}

} // namespace

QSqliteService::QSqliteService(QString dbPath)
	: dbPath_(dbPath.isEmpty() ? defaultDbFilePath() : std::move(dbPath)) {}

// 호출 스레드 전용 커넥션 확보
QSqlDatabase QSqliteService::ensureOpenConnectionForThisThread()
{
    const QString name = connectionNameForCurrentThread(dbPath_);
    QSqlDatabase db;

    if (!QSqlDatabase::contains(name)) {
        db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
        db.setDatabaseName(dbPath_);
    } else {
        db = QSqlDatabase::database(name, /*open=*/false);
        if (!db.isValid()) {
            // 종료된 스레드와 같은 thread id: 이전 커넥션은 버리고 새로 연다
            QSqlDatabase::removeDatabase(name);
            db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
            db.setDatabaseName(dbPath_);
        } else if (db.databaseName().isEmpty()) {
            db.setDatabaseName(dbPath_);
        }
    }

    if (!db.isOpen() && !db.open()) {
        qCCritical(LC_STORE) << "[SQL] DB open failed:" << db.lastError().text()
                             << " path=" << db.databaseName()
                             << " drivers=" << QSqlDatabase::drivers();
    }
    return db;
}

void QSqliteService::setError(const QString& where, const QString& what)
{
	QMutexLocker lk(&errMutex_);
	lastErrors_.insert(QThread::currentThreadId(), QStringLiteral("%1: %2").arg(where, what));
	qCWarning(LC_STORE).noquote() << "[" + where + "]" << what;
}

QString QSqliteService::lastError() const
{
	QMutexLocker lk(&errMutex_);
	return lastErrors_.value(QThread::currentThreadId());
}

bool QSqliteService::initializeDatabase()
{
	QMutexLocker locker(&dbMutex);
	if (!ensureParentDir(dbPath_)) {
		setError("initializeDatabase", QStringLiteral("cannot create directory for %1").arg(dbPath_));
		return false;
	}

    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("initializeDatabase", db.lastError().text());
        return false;
    }

    {   // 신뢰성 옵션
        QSqlQuery pragma(db);
        if (!pragma.exec("PRAGMA journal_mode=WAL;"))
            qCWarning(LC_STORE) << "[SQL] journal_mode=WAL failed (ignored):" << pragma.lastError().text();
        if (!pragma.exec("PRAGMA synchronous=NORMAL;"))
            qCWarning(LC_STORE) << "[SQL] synchronous=NORMAL failed (ignored):" << pragma.lastError().text();
    }

    SchemaMigrator migrator(db);
    QString why;
    if (!migrator.migrate(&why)) {
        setError("initializeDatabase", why);
        return false;
    }

    qCInfo(LC_STORE) << "[SQL] Database opened & schema ready. path=" << db.databaseName()
                     << " version=" << migrator.currentVersion();
    return true;
}

bool QSqliteService::getDevice(const QString& address, std::optional<Device>* out)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("getDevice", db.lastError().text());
        return false;
    }

    QSqlQuery q(db);
    q.prepare(QStringLiteral("SELECT %1 FROM devices WHERE ip = ?").arg(QLatin1String(kDeviceColumns)));
    q.addBindValue(address);
    if (!q.exec()) {
        setError("getDevice", q.lastError().text());
        return false;
    }

    if (out) {
        if (q.next()) *out = rowToDevice(q);
        else          out->reset();
    }
    return true;
}

bool QSqliteService::recordOnlineObservation(const QString& address, const QString& hardwareId,
                                             const QString& label, const QDateTime& now)
{
	return recordObservation(address, hardwareId, label, now, /*online=*/true);
}

bool QSqliteService::recordOfflineObservation(const QString& address, const QString& hardwareId,
                                              const QString& label, const QDateTime& now)
{
	return recordObservation(address, hardwareId, label, now, /*online=*/false);
}

bool QSqliteService::recordObservation(const QString& address, const QString& hardwareId,
                                       const QString& label, const QDateTime& now, bool online)
{
	const char* where = online ? "recordOnlineObservation" : "recordOfflineObservation";

	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError(where, db.lastError().text());
        return false;
    }

    const QString ts      = toDbTime(now.isValid() ? now : QDateTime::currentDateTimeUtc());
    const QString macSafe = hardwareId.isEmpty() ? QStringLiteral("unknown") : hardwareId;
    const QString hostSafe = label.isEmpty() ? QStringLiteral("Unknown") : label;

    if (!db.transaction()) {
        setError(where, db.lastError().text());
        return false;
    }

    auto fail = [&](const QSqlQuery& q) {
        setError(where, q.lastError().text());
        db.rollback();
        return false;
    };

    QSqlQuery sel(db);
    sel.prepare("SELECT id FROM devices WHERE ip = ?");
    sel.addBindValue(address);
    if (!sel.exec()) return fail(sel);
    const bool exists = sel.next();
    sel.finish();

    QSqlQuery q(db);
    if (exists && online) {
        q.prepare("UPDATE devices SET "
                  "mac = ?, hostname = ?, last_seen = ?, last_seen_online = ?, "
                  "scans_seen_online = scans_seen_online + 1, "
                  "consecutive_offline = 0, "
                  "consecutive_online = consecutive_online + 1, "
                  "updated_at = ? "
                  "WHERE ip = ?");
        q.addBindValue(macSafe);
        q.addBindValue(hostSafe);
        q.addBindValue(ts);
        q.addBindValue(ts);
        q.addBindValue(ts);
        q.addBindValue(address);
    } else if (exists) {
        q.prepare("UPDATE devices SET "
                  "last_seen = ?, "
                  "scans_seen_offline = scans_seen_offline + 1, "
                  "consecutive_offline = consecutive_offline + 1, "
                  "consecutive_online = 0, "
                  "updated_at = ? "
                  "WHERE ip = ?");
        q.addBindValue(ts);
        q.addBindValue(ts);
        q.addBindValue(address);
    } else {
        q.prepare("INSERT INTO devices ("
                  "ip, mac, hostname, notes, first_seen, last_seen, last_seen_online, "
                  "total_scans, scans_seen_online, scans_seen_offline, "
                  "consecutive_offline, consecutive_online, created_at, updated_at"
                  ") VALUES (?, ?, ?, '', ?, ?, ?, 1, ?, ?, ?, ?, ?, ?)");
        q.addBindValue(address);
        q.addBindValue(macSafe);
        q.addBindValue(hostSafe);
        q.addBindValue(ts);
        q.addBindValue(ts);
        q.addBindValue(online ? QVariant(ts) : QVariant());
        q.addBindValue(online ? 1 : 0);
        q.addBindValue(online ? 0 : 1);
        q.addBindValue(online ? 0 : 1);
        q.addBindValue(online ? 1 : 0);
        q.addBindValue(ts);
        q.addBindValue(ts);
    }

    if (!q.exec()) return fail(q);

    if (!db.commit()) {
        setError(where, db.lastError().text());
        db.rollback();
        return false;
    }
    return true;
}

bool QSqliteService::bumpTotalScansForAllKnownDevices()
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("bumpTotalScansForAllKnownDevices", db.lastError().text());
        return false;
    }

    QSqlQuery q(db);
    if (!q.exec("UPDATE devices SET total_scans = total_scans + 1")) {
        setError("bumpTotalScansForAllKnownDevices", q.lastError().text());
        return false;
    }
    qCDebug(LC_STORE) << "[bumpTotalScans] rows=" << q.numRowsAffected();
    return true;
}

bool QSqliteService::appendScanEvent(int devicesFound, const QString& method,
                                     const QDateTime& now, qint64* outScanId)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("appendScanEvent", db.lastError().text());
        return false;
    }

    QSqlQuery q(db);
    q.prepare("INSERT INTO scans (scan_time, devices_found, scan_method) VALUES (?, ?, ?)");
    q.addBindValue(toDbTime(now.isValid() ? now : QDateTime::currentDateTimeUtc()));
    q.addBindValue(devicesFound);
    q.addBindValue(method);
    if (!q.exec()) {
        setError("appendScanEvent", q.lastError().text());
        return false;
    }
    if (outScanId) *outScanId = q.lastInsertId().toLongLong();
    return true;
}

bool QSqliteService::appendCategorizationLog(const CategorizationLogEntry& e)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("appendCategorizationLog", db.lastError().text());
        return false;
    }

    QSqlQuery q(db);
    q.prepare("INSERT INTO categorization_log ("
              "scan_id, ip, total_scans, scans_seen_online, consecutive_online, consecutive_offline, "
              "appearance_rate, category, online, reason, logged_at"
              ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    q.addBindValue(e.scanId >= 0 ? QVariant(e.scanId) : QVariant());
    q.addBindValue(e.address);
    q.addBindValue(e.totalScans);
    q.addBindValue(e.scansSeenOnline);
    q.addBindValue(e.consecutiveOnline);
    q.addBindValue(e.consecutiveOffline);
    q.addBindValue(e.appearanceRate);
    q.addBindValue(deviceCategoryName(e.category));
    q.addBindValue(e.online ? 1 : 0);
    q.addBindValue(e.reason);
    q.addBindValue(toDbTime(e.loggedAt.isValid() ? e.loggedAt : QDateTime::currentDateTimeUtc()));

    if (!q.exec()) {
        setError("appendCategorizationLog", q.lastError().text());
        return false;
    }
    return true;
}

bool QSqliteService::updateNotes(const QString& address, const QString& notes)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("updateNotes", db.lastError().text());
        return false;
    }

    QSqlQuery q(db);
    q.prepare("UPDATE devices SET notes = ?, updated_at = ? WHERE ip = ?");
    q.addBindValue(notes.isNull() ? QString("") : notes);
    q.addBindValue(toDbTime(QDateTime::currentDateTimeUtc()));
    q.addBindValue(address);
    if (!q.exec()) {
        setError("updateNotes", q.lastError().text());
        return false;
    }
    if (q.numRowsAffected() == 0) {
        setError("updateNotes", QStringLiteral("device not found: %1").arg(address));
        return false;
    }
    return true;
}

bool QSqliteService::getAllDevices(QVector<Device>* outRows)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("getAllDevices", db.lastError().text());
        return false;
    }

    QSqlQuery q(db);
    if (!q.exec(QStringLiteral("SELECT %1 FROM devices ORDER BY last_seen DESC").arg(QLatin1String(kDeviceColumns)))) {
        setError("getAllDevices", q.lastError().text());
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) outRows->push_back(rowToDevice(q));
    }
    return true;
}

bool QSqliteService::getStats(const QDateTime& now, DatabaseStats* out)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("getStats", db.lastError().text());
        return false;
    }

    DatabaseStats s;
    QSqlQuery q(db);

    if (!q.exec("SELECT COUNT(*) FROM devices") || !q.next()) {
        setError("getStats", q.lastError().text());
        return false;
    }
    s.totalDevices = q.value(0).toInt();

    if (!q.exec("SELECT COUNT(*) FROM scans") || !q.next()) {
        setError("getStats", q.lastError().text());
        return false;
    }
    s.totalScans = q.value(0).toInt();

    const QDateTime ref = now.isValid() ? now : QDateTime::currentDateTimeUtc();
    q.prepare("SELECT COUNT(*) FROM devices WHERE last_seen_online IS NOT NULL AND last_seen_online >= ?");
    q.addBindValue(toDbTime(ref.addSecs(-scan::ACTIVE_WINDOW_SEC)));
    if (!q.exec() || !q.next()) {
        setError("getStats", q.lastError().text());
        return false;
    }
    s.active24h = q.value(0).toInt();

    if (out) *out = s;
    return true;
}

bool QSqliteService::selectCategorizationLog(int offset, int limit,
                                             QVector<CategorizationLogEntry>* outRows, int* outTotal)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("selectCategorizationLog", db.lastError().text());
        return false;
    }

    // total
    {
        QSqlQuery qc(db);
        if (!qc.exec("SELECT COUNT(*) FROM categorization_log") || !qc.next()) {
            setError("selectCategorizationLog", qc.lastError().text());
            return false;
        }
        if (outTotal) *outTotal = qc.value(0).toInt();
    }

    QSqlQuery q(db);
    q.prepare("SELECT id, scan_id, ip, total_scans, scans_seen_online, consecutive_online, "
              "consecutive_offline, appearance_rate, category, online, reason, logged_at "
              "FROM categorization_log ORDER BY id DESC LIMIT ? OFFSET ?");
    q.addBindValue(limit);
    q.addBindValue(offset);
    if (!q.exec()) {
        setError("selectCategorizationLog", q.lastError().text());
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            CategorizationLogEntry r;
            r.id                 = q.value(0).toLongLong();
            r.scanId             = q.value(1).isNull() ? -1 : q.value(1).toLongLong();
            r.address            = q.value(2).toString();
            r.totalScans         = q.value(3).toInt();
            r.scansSeenOnline    = q.value(4).toInt();
            r.consecutiveOnline  = q.value(5).toInt();
            r.consecutiveOffline = q.value(6).toInt();
            r.appearanceRate     = q.value(7).toDouble();
            r.category           = deviceCategoryFromName(q.value(8).toString());
            r.online             = q.value(9).toInt() != 0;
            r.reason             = q.value(10).toString();
            r.loggedAt           = fromDbTime(q.value(11));
            outRows->push_back(r);
        }
    }
    return true;
}

bool QSqliteService::selectScanEvents(int limit, QVector<ScanEvent>* outRows)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("selectScanEvents", db.lastError().text());
        return false;
    }

    QSqlQuery q(db);
    q.prepare("SELECT id, scan_time, devices_found, scan_method FROM scans ORDER BY id DESC LIMIT ?");
    q.addBindValue(limit);
    if (!q.exec()) {
        setError("selectScanEvents", q.lastError().text());
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            ScanEvent e;
            e.id           = q.value(0).toLongLong();
            e.scanTime     = fromDbTime(q.value(1));
            e.devicesFound = q.value(2).toInt();
            e.scanMethod   = q.value(3).toString();
            outRows->push_back(e);
        }
    }
    return true;
}

bool QSqliteService::insertSystemLog(int level, const QString& tag, const QString& message,
                                     const QDateTime& timestamp, const QString& extra)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("insertSystemLog", db.lastError().text());
        return false;
    }

    QSqlQuery q(db);
    q.prepare("INSERT INTO system_logs (level, tag, message, timestamp, extra) "
              "VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(level);
    q.addBindValue(tag);
    q.addBindValue(message);
    q.addBindValue(toDbTime(timestamp.isValid() ? timestamp : QDateTime::currentDateTimeUtc()));
    q.addBindValue(extra);

    if (!q.exec()) {
        setError("insertSystemLog", q.lastError().text());
        return false;
    }
    return true;
}

bool QSqliteService::selectSystemLogs(int offset, int limit,
                                      int minLevel, const QString& tagLike, const QString& sinceIso,
                                      QVector<SystemLog>* outRows, int* outTotal)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        setError("selectSystemLogs", db.lastError().text());
        return false;
    }

    QString where = "WHERE level >= ?";
    QList<QVariant> binds; binds << minLevel;

    if (!tagLike.isEmpty()) { where += " AND tag LIKE ?";      binds << ("%"+tagLike+"%"); }
    if (!sinceIso.isEmpty()){ where += " AND timestamp >= ?";  binds << sinceIso; }

    // total
    QSqlQuery qc(db);
    qc.prepare("SELECT COUNT(*) FROM system_logs " + where);
    for (const auto& v : binds) qc.addBindValue(v);
    if (!qc.exec() || !qc.next()) {
        setError("selectSystemLogs", qc.lastError().text());
        return false;
    }
    if (outTotal) *outTotal = qc.value(0).toInt();

    // rows
    QSqlQuery q(db);
    q.prepare("SELECT id, level, tag, message, timestamp, extra "
              "FROM system_logs " + where + " ORDER BY id DESC LIMIT ? OFFSET ?");
    for (const auto& v : binds) q.addBindValue(v);
    q.addBindValue(limit);
    q.addBindValue(offset);

    if (!q.exec()) {
        setError("selectSystemLogs", q.lastError().text());
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            SystemLog r;
            r.id        = q.value(0).toInt();
            r.level     = q.value(1).toInt();
            r.tag       = q.value(2).toString();
            r.message   = q.value(3).toString();
            r.timestamp = fromDbTime(q.value(4));
            r.extra     = q.value(5).toString();
            outRows->push_back(r);
        }
    }
    return true;
}
