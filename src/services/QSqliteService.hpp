#pragma once
#include <QDateTime>
#include <QVector>
#include <QString>
#include <QHash>
#include <QMutex>
#include <QSqlDatabase>

#include "services/HistoryStore.hpp"
#include "log/SystemLogTypes.hpp"


class QSqliteService : public HistoryStore {
public:
	explicit QSqliteService(QString dbPath = QString());

	const QString& dbPath() const { return dbPath_; }

	// Opens the file, sets pragmas and runs SchemaMigrator
    bool initializeDatabase();

    // HistoryStore
    bool getDevice(const QString& address, std::optional<Device>* out) override;
    bool recordOnlineObservation(const QString& address, const QString& hardwareId,
                                 const QString& label, const QDateTime& now) override;
    bool recordOfflineObservation(const QString& address, const QString& hardwareId,
                                  const QString& label, const QDateTime& now) override;
    bool bumpTotalScansForAllKnownDevices() override;
    bool appendScanEvent(int devicesFound, const QString& method,
                         const QDateTime& now, qint64* outScanId) override;
    bool appendCategorizationLog(const CategorizationLogEntry& entry) override;
    bool updateNotes(const QString& address, const QString& notes) override;
    bool getAllDevices(QVector<Device>* outRows) override;
    bool getStats(const QDateTime& now, DatabaseStats* out) override;
    bool selectCategorizationLog(int offset, int limit,
                                 QVector<CategorizationLogEntry>* outRows, int* outTotal) override;
    bool selectScanEvents(int limit, QVector<ScanEvent>* outRows) override;
    bool selectSystemLogs(int offset, int limit,
                          int minLevel, const QString& tagLike, const QString& sinceIso,
                          QVector<SystemLog>* outRows,
                          int* outTotal) override;
    QString lastError() const override;

    // 시스템로그
    bool insertSystemLog(int level, const QString& tag, const QString& message,
                         const QDateTime& timestamp, const QString& extra = QString());

private:
	QSqlDatabase ensureOpenConnectionForThisThread();
	bool recordObservation(const QString& address, const QString& hardwareId,
	                       const QString& label, const QDateTime& now, bool online);
	void setError(const QString& where, const QString& what);

	QString dbPath_;
	QMutex dbMutex;
	mutable QMutex errMutex_;
	QHash<Qt::HANDLE, QString> lastErrors_;	// keyed by the failing thread
};
