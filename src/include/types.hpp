#pragma once
#include <QString>
#include <QDateTime>
#include <QVector>
#include <QMetaType>
#include "include/states.hpp"

// Persisted per-address history (devices table)
struct Device {
	qint64		id = -1;
	QString		address;
	QString		hardwareId;
	QString		label;
	QString		notes;

	QDateTime	firstSeen;
	QDateTime	lastSeen;
	QDateTime	lastSeenOnline;			// invalid when never seen online

	int			totalScans         = 0;
	int			scansSeenOnline    = 0;
	int			scansSeenOffline   = 0;
	int			consecutiveOffline = 0;
	int			consecutiveOnline  = 0;
};

// One row per discovered host, as reported by a DiscoverySource
struct DiscoveredDevice {
	QString address;
	QString hardwareId;
	QString label = QStringLiteral("Unknown");
	QString status = QStringLiteral("online");
};

// Fixed-shape view of a device for one cycle
struct EnrichedDevice {
	QString			address;
	QString			hardwareId;
	QString			label;
	QString			status = QStringLiteral("online");		// "online" | "offline"
	DeviceCategory	category = DeviceCategory::New;
	QString			reason;
	QDateTime		firstSeen;
	QDateTime		lastSeen;
	int				totalScans      = 0;
	int				scansSeenOnline = 0;
	double			appearanceRate  = 0.0;
	QString			notes;
};

// In-memory bookkeeping that is never persisted
struct TrackedDevice {
	EnrichedDevice	device;
	DeviceStatus	deviceStatus = DeviceStatus::New;
	int				missedScans  = 0;
};

struct ScanEvent {
	qint64		id = -1;
	QDateTime	scanTime;
	int			devicesFound = 0;
	QString		scanMethod;
};

struct CategorizationLogEntry {
	qint64			id = -1;
	qint64			scanId = -1;
	QString			address;
	int				totalScans         = 0;
	int				scansSeenOnline    = 0;
	int				consecutiveOnline  = 0;
	int				consecutiveOffline = 0;
	double			appearanceRate     = 0.0;
	DeviceCategory	category = DeviceCategory::New;
	bool			online = true;
	QString			reason;
	QDateTime		loggedAt;
};

struct DatabaseStats {
	int totalDevices = 0;
	int totalScans   = 0;		// number of scan events
	int active24h    = 0;
};

// Result of a single reconciliation
struct ReconcileResult {
	QVector<TrackedDevice>	devices;
	int						onlineCount  = 0;
	int						newCount     = 0;
	int						offlineCount = 0;
};

// Everything the worker hands back to the orchestrator after a cycle
struct CycleOutcome {
	ReconcileResult	result;
	qint64			scanId = -1;
	QString			method;
	QDateTime		finishedAt;
};

Q_DECLARE_METATYPE(ReconcileResult)
Q_DECLARE_METATYPE(CycleOutcome)
