#pragma once
#include <functional>
#include <vector>
#include <QSqlDatabase>
#include <QString>

// One ordered, idempotent schema change. The step itself must be safe to
// run on a database that already contains it.
struct MigrationStep {
	int			version = 0;
	const char* name = "unnamed";
	std::function<bool(QSqlDatabase&, QString*)> apply;
};

class SchemaMigrator {
public:
	explicit SchemaMigrator(QSqlDatabase db) : db_(std::move(db)) {}

	static const std::vector<MigrationStep>& steps();
	static int latestVersion();

	int currentVersion() const;

	// Applies every step newer than PRAGMA user_version, each in its own transaction
	bool migrate(QString* error = nullptr);

	// Applies a single step and stamps its version; used directly by tests
	bool applyStep(const MigrationStep& step, QString* error = nullptr);

	static bool tableExists(QSqlDatabase& db, const QString& table);
	static bool hasColumn(QSqlDatabase& db, const QString& table, const QString& column);

private:
	bool setVersion(int version, QString* error);

	QSqlDatabase db_;
};
