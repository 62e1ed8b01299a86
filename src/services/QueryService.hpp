#pragma once
#include <QDateTime>
#include <QString>
#include <QVector>

#include "include/types.hpp"
#include "include/scan_params.hpp"
#include "log/SystemLogTypes.hpp"
#include "discovery/ApplianceDetector.hpp"
#include "discovery/PortProbe.hpp"
#include "policy/CategorizationPolicy.hpp"
#include "services/ScannerContext.hpp"

class HistoryStore;

struct DeviceSummary {
	QString			address;
	QString			label;
	int				totalScans      = 0;
	int				scansSeenOnline = 0;
	double			appearanceRate  = 0.0;	// 0..1
	DeviceCategory	category = DeviceCategory::New;
	QString			notes;
};

struct StatsReport {
	DatabaseStats			totals;
	QVector<DeviceSummary>	devices;
};

struct NotesResult {
	bool	success = false;
	QString	message;
};

struct PortScanReport {
	QString				address;
	QVector<PortResult>	ports;		// open ports only
	ApplianceHint		appliance;
};

struct SystemLogQuery {
	int		limit    = scan::LOG_LIMIT_DEFAULT;
	int		minLevel = 0;		// SysLogLevel as int
	QString	tag;				// substring match
	QString	since;				// ISO-8601, empty for no bound
};

// Read side used by the transport. Never blocks or alters a running scan.
class QueryService {
public:
	QueryService(HistoryStore* store, ScannerContext* ctx, PortProbe* probe,
				 CategorizationPolicy policy = {});

	ScanSnapshot currentDevices() const;

	bool stats(const QDateTime& now, StatsReport* out, QString* error = nullptr);

	// limit is clamped to 1..LOG_LIMIT_MAX; entries newest first
	bool categorizationLog(int limit, QVector<CategorizationLogEntry>* outRows, int* outTotal,
						   QString* error = nullptr);

	// newest first
	bool recentScans(int limit, QVector<ScanEvent>* outRows, QString* error = nullptr);
	bool systemLogs(const SystemLogQuery& query, QVector<SystemLog>* outRows, int* outTotal,
					QString* error = nullptr);

	NotesResult updateNotes(const QString& address, const QString& notes);

	// Empty ports means the default list. Runs on a worker thread.
	PortScanReport probePorts(const QString& address, const QVector<int>& ports);

	ApplianceDetector& applianceDetector() { return appliance_; }

	static int clampLogLimit(int limit);

private:
	HistoryStore*			store_;
	ScannerContext*			ctx_;
	PortProbe*				probe_;
	CategorizationPolicy	policy_;
	ApplianceDetector		appliance_;
};
