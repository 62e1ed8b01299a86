#include "hub/Events.hpp"

namespace Events {

QJsonValue isoOrNull(const QDateTime& t)
{
	return t.isValid() ? QJsonValue(t.toUTC().toString(Qt::ISODateWithMs)) : QJsonValue(QJsonValue::Null);
}

QJsonObject deviceToJson(const TrackedDevice& t)
{
	const EnrichedDevice& d = t.device;
	QJsonObject j;
	j["address"]         = d.address;
	j["hardware_id"]     = d.hardwareId;
	j["label"]           = d.label;
	j["status"]          = d.status;
	j["device_status"]   = deviceStatusName(t.deviceStatus);
	j["device_category"] = deviceCategoryName(d.category);
	j["category_reason"] = d.reason;
	j["first_seen"]      = isoOrNull(d.firstSeen);
	j["last_seen"]       = isoOrNull(d.lastSeen);
	j["total_scans"]     = d.totalScans;
	j["scans_seen_online"] = d.scansSeenOnline;
	j["appearance_rate"] = d.appearanceRate;
	j["missed_scans"]    = t.missedScans;
	j["notes"]           = d.notes;
	return j;
}

QJsonArray devicesToJson(const QVector<TrackedDevice>& devices)
{
	QJsonArray arr;
	for (const TrackedDevice& t : devices) arr.append(deviceToJson(t));
	return arr;
}

QJsonObject scanStart(States::ScanTrigger trigger)
{
	return QJsonObject{
		{"type", "scan_start"},
		{"message", trigger == States::ScanTrigger::Manual ? "Manual scan requested..."
														   : "Starting network scan..."}
	};
}

QJsonObject scanProgress(States::ScanTrigger trigger, const ReconcileResult& r)
{
	const QString msg = trigger == States::ScanTrigger::Manual
		? QStringLiteral("Manual scan complete: %1 online, %2 new, %3 offline")
		: QStringLiteral("Scan complete: %1 devices online, %2 new, %3 offline");
	return QJsonObject{
		{"type", "scan_progress"},
		{"message", msg.arg(r.onlineCount).arg(r.newCount).arg(r.offlineCount)}
	};
}

QJsonObject scanUpdate(const ReconcileResult& r, const ScanSnapshot& s)
{
	QJsonObject j;
	j["type"]          = "scan_update";
	j["devices"]       = devicesToJson(r.devices);
	j["count"]         = r.onlineCount;
	j["new_count"]     = r.newCount;
	j["offline_count"] = r.offlineCount;
	j["timestamp"]     = isoOrNull(s.lastScan);
	j["next_scan"]     = isoOrNull(s.nextScan);
	j["scan_interval"] = s.scanInterval;
	j["scanning"]      = false;
	return j;
}

QJsonObject scanError(const QString& message)
{
	return QJsonObject{
		{"type", "scan_error"},
		{"message", QStringLiteral("Scan error: %1").arg(message)}
	};
}

QJsonObject initialState(const ScanSnapshot& s)
{
	QJsonObject j;
	j["type"]          = "initial_state";
	j["devices"]       = devicesToJson(s.devices);
	j["count"]         = s.devices.size();
	j["timestamp"]     = isoOrNull(s.lastScan);
	j["next_scan"]     = isoOrNull(s.nextScan);
	j["scan_interval"] = s.scanInterval;
	j["scanning"]      = s.scanning;
	return j;
}

QJsonObject devicesReply(const ScanSnapshot& s)
{
	QJsonObject j;
	j["type"]      = "devices";
	j["success"]   = true;
	j["devices"]   = devicesToJson(s.devices);
	j["count"]     = s.devices.size();
	j["last_scan"] = isoOrNull(s.lastScan);
	j["scanning"]  = s.scanning;
	return j;
}

QJsonObject statsReply(const StatsReport& r)
{
	QJsonArray devices;
	for (const DeviceSummary& d : r.devices) {
		devices.append(QJsonObject{
			{"address", d.address},
			{"label", d.label},
			{"total_scans", d.totalScans},
			{"scans_seen_online", d.scansSeenOnline},
			// percent, one decimal
			{"appearance_rate", qRound(d.appearanceRate * 1000.0) / 10.0},
			{"category", deviceCategoryName(d.category)},
			{"notes", d.notes}
		});
	}

	QJsonObject j;
	j["type"]          = "stats";
	j["success"]       = true;
	j["total_devices"] = r.totals.totalDevices;
	j["total_scans"]   = r.totals.totalScans;
	j["active_24h"]    = r.totals.active24h;
	j["devices"]       = devices;
	return j;
}

QJsonObject logReply(const QVector<CategorizationLogEntry>& rows, int total)
{
	QJsonArray entries;
	for (const CategorizationLogEntry& e : rows) {
		QJsonObject o;
		o["id"]                  = e.id;
		o["scan_id"]             = e.scanId >= 0 ? QJsonValue(e.scanId) : QJsonValue(QJsonValue::Null);
		o["address"]             = e.address;
		o["total_scans"]         = e.totalScans;
		o["scans_seen_online"]   = e.scansSeenOnline;
		o["consecutive_online"]  = e.consecutiveOnline;
		o["consecutive_offline"] = e.consecutiveOffline;
		o["appearance_rate"]     = e.appearanceRate;
		o["category"]            = deviceCategoryName(e.category);
		o["online"]              = e.online;
		o["reason"]              = e.reason;
		o["logged_at"]           = isoOrNull(e.loggedAt);
		entries.append(o);
	}

	return QJsonObject{
		{"type", "categorization_log"},
		{"success", true},
		{"count", entries.size()},
		{"total", total},
		{"entries", entries}
	};
}

QJsonObject scansReply(const QVector<ScanEvent>& rows)
{
	QJsonArray scans;
	for (const ScanEvent& e : rows) {
		scans.append(QJsonObject{
			{"id", e.id},
			{"scan_time", isoOrNull(e.scanTime)},
			{"devices_found", e.devicesFound},
			{"scan_method", e.scanMethod}
		});
	}
	return QJsonObject{
		{"type", "scans"},
		{"success", true},
		{"count", scans.size()},
		{"scans", scans}
	};
}

QJsonObject systemLogsReply(const QVector<SystemLog>& rows, int total)
{
	QJsonArray entries;
	for (const SystemLog& r : rows) {
		QJsonObject o;
		o["id"]        = r.id;
		o["level"]     = r.level;
		o["tag"]       = r.tag;
		o["message"]   = r.message;
		o["timestamp"] = isoOrNull(r.timestamp);
		o["extra"]     = r.extra.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(r.extra);
		entries.append(o);
	}
	return QJsonObject{
		{"type", "system_logs"},
		{"success", true},
		{"count", entries.size()},
		{"total", total},
		{"entries", entries}
	};
}

QJsonObject notesReply(const NotesResult& r)
{
	return QJsonObject{
		{"type", "notes_result"},
		{"success", r.success},
		{"message", r.message}
	};
}

QJsonObject portScanReply(const PortScanReport& r)
{
	QJsonArray ports;
	for (const PortResult& p : r.ports) {
		ports.append(QJsonObject{{"port", p.port}, {"status", p.status}, {"service", p.service}});
	}
	return QJsonObject{
		{"type", "port_scan"},
		{"address", r.address},
		{"ports", ports},
		{"appliance", r.appliance.toJson()}
	};
}

QJsonObject failure(const QString& type, const QString& message)
{
	return QJsonObject{{"type", type}, {"success", false}, {"message", message}};
}

QJsonObject error(const QString& message)
{
	return QJsonObject{{"type", "error"}, {"message", message}};
}

} // namespace Events
