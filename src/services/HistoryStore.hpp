#pragma once
#include <optional>
#include <QDateTime>
#include <QString>
#include <QVector>

#include "include/types.hpp"
#include "log/SystemLogTypes.hpp"

// Durable per-device history consumed by the reconciliation engine.
// Every call is atomic on its own; on failure it returns false and
// lastError() describes why. lastError() is per calling thread, so a
// failure on the scan worker never clobbers the transport's message.
class HistoryStore {
public:
	virtual ~HistoryStore() = default;

	virtual bool getDevice(const QString& address, std::optional<Device>* out) = 0;

	virtual bool recordOnlineObservation(const QString& address, const QString& hardwareId,
										 const QString& label, const QDateTime& now) = 0;
	virtual bool recordOfflineObservation(const QString& address, const QString& hardwareId,
										  const QString& label, const QDateTime& now) = 0;

	// Called once per cycle before any per-device update
	virtual bool bumpTotalScansForAllKnownDevices() = 0;

	virtual bool appendScanEvent(int devicesFound, const QString& method,
								 const QDateTime& now, qint64* outScanId) = 0;
	virtual bool appendCategorizationLog(const CategorizationLogEntry& entry) = 0;

	// Never touched by reconciliation
	virtual bool updateNotes(const QString& address, const QString& notes) = 0;

	virtual bool getAllDevices(QVector<Device>* outRows) = 0;
	virtual bool getStats(const QDateTime& now, DatabaseStats* out) = 0;

	virtual bool selectCategorizationLog(int offset, int limit,
										 QVector<CategorizationLogEntry>* outRows, int* outTotal) = 0;
	virtual bool selectScanEvents(int limit, QVector<ScanEvent>* outRows) = 0;

	// minLevel 0..4, tagLike is a substring, sinceIso an ISO-8601 lower bound
	virtual bool selectSystemLogs(int offset, int limit,
								  int minLevel, const QString& tagLike, const QString& sinceIso,
								  QVector<SystemLog>* outRows, int* outTotal) = 0;

	virtual QString lastError() const = 0;
};
