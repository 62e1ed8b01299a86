#pragma once
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

#include "include/states.hpp"
#include "include/types.hpp"
#include "services/QueryService.hpp"
#include "services/ScannerContext.hpp"

// JSON shapes of everything sent to subscribers
namespace Events {
	QJsonValue isoOrNull(const QDateTime& t);

	QJsonObject deviceToJson(const TrackedDevice& t);
	QJsonArray devicesToJson(const QVector<TrackedDevice>& devices);

	// broadcast
	QJsonObject scanStart(States::ScanTrigger trigger);
	QJsonObject scanProgress(States::ScanTrigger trigger, const ReconcileResult& r);
	QJsonObject scanUpdate(const ReconcileResult& r, const ScanSnapshot& s);
	QJsonObject scanError(const QString& message);
	QJsonObject initialState(const ScanSnapshot& s);

	// replies
	QJsonObject devicesReply(const ScanSnapshot& s);
	QJsonObject statsReply(const StatsReport& r);
	QJsonObject logReply(const QVector<CategorizationLogEntry>& rows, int total);
	QJsonObject scansReply(const QVector<ScanEvent>& rows);
	QJsonObject systemLogsReply(const QVector<SystemLog>& rows, int total);
	QJsonObject notesReply(const NotesResult& r);
	QJsonObject portScanReply(const PortScanReport& r);
	QJsonObject failure(const QString& type, const QString& message);
	QJsonObject error(const QString& message);
}
