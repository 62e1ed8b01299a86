#include "services/QueryService.hpp"
#include <QDebug>

#include "services/HistoryStore.hpp"
#include "services/SqlCommon.hpp"
#include "include/scan_params.hpp"
#include "log/lanwatch_logging.hpp"
#include "log/SystemLogger.hpp"

QueryService::QueryService(HistoryStore* store, ScannerContext* ctx, PortProbe* probe,
						   CategorizationPolicy policy)
	: store_(store), ctx_(ctx), probe_(probe), policy_(std::move(policy))
{}

ScanSnapshot QueryService::currentDevices() const
{
	return ctx_ ? ctx_->snapshot() : ScanSnapshot{};
}

int QueryService::clampLogLimit(int limit)
{
	return qBound(1, limit, scan::LOG_LIMIT_MAX);
}

bool QueryService::stats(const QDateTime& now, StatsReport* out, QString* error)
{
	StatsReport r;
	QVector<Device> rows;

	if (!store_ || !store_->getStats(now, &r.totals) || !store_->getAllDevices(&rows)) {
		if (error) *error = store_ ? store_->lastError() : QStringLiteral("no history store");
		return false;
	}

	r.devices.reserve(rows.size());
	for (const Device& d : rows) {
		DeviceSummary s;
		s.address         = d.address;
		s.label           = d.label;
		s.totalScans      = d.totalScans;
		s.scansSeenOnline = d.scansSeenOnline;
		s.appearanceRate  = CategorizationPolicy::appearanceRate(d.totalScans, d.scansSeenOnline);
		s.category        = policy_.classify(std::optional<Device>(d), d.consecutiveOffline == 0).category;
		s.notes           = d.notes;
		r.devices.push_back(s);
	}

	if (out) *out = std::move(r);
	return true;
}

bool QueryService::categorizationLog(int limit, QVector<CategorizationLogEntry>* outRows, int* outTotal,
									 QString* error)
{
	if (!store_ || !store_->selectCategorizationLog(0, clampLogLimit(limit), outRows, outTotal)) {
		if (error) *error = store_ ? store_->lastError() : QStringLiteral("no history store");
		return false;
	}
	return true;
}

bool QueryService::recentScans(int limit, QVector<ScanEvent>* outRows, QString* error)
{
	if (!store_ || !store_->selectScanEvents(clampLogLimit(limit), outRows)) {
		if (error) *error = store_ ? store_->lastError() : QStringLiteral("no history store");
		return false;
	}
	return true;
}

bool QueryService::systemLogs(const SystemLogQuery& query, QVector<SystemLog>* outRows, int* outTotal,
							  QString* error)
{
	QString since;
	if (!query.since.isEmpty()) {
		const QDateTime t = QDateTime::fromString(query.since, Qt::ISODateWithMs);
		if (!t.isValid()) {
			if (error) *error = QStringLiteral("invalid since: %1").arg(query.since);
			return false;
		}
		since = SqlCommon::toDbTime(t);
	}

	const int minLevel = qBound(int(SysLogLevel::Debug), query.minLevel, int(SysLogLevel::Critical));
	if (!store_ || !store_->selectSystemLogs(0, clampLogLimit(query.limit), minLevel, query.tag, since,
											 outRows, outTotal)) {
		if (error) *error = store_ ? store_->lastError() : QStringLiteral("no history store");
		return false;
	}
	return true;
}

NotesResult QueryService::updateNotes(const QString& address, const QString& notes)
{
	if (address.isEmpty())
		return { false, QStringLiteral("address is required") };

	if (!store_ || !store_->updateNotes(address, notes)) {
		const QString why = store_ ? store_->lastError() : QStringLiteral("no history store");
		qCWarning(LC_STORE).noquote() << "[updateNotes]" << address << "rejected:" << why;
		return { false, why };
	}

	SystemLogger::info("STORE", QStringLiteral("notes updated for %1").arg(address));
	return { true, QStringLiteral("Notes updated") };
}

PortScanReport QueryService::probePorts(const QString& address, const QVector<int>& ports)
{
	PortScanReport r;
	r.address = address;
	if (!probe_) return r;

	r.ports = probe_->openPorts(address, ports.isEmpty() ? TcpPortProbe::defaultPorts() : ports);

	QVector<int> open;
	for (const PortResult& p : r.ports) open.push_back(p.port);
	r.appliance = appliance_.detect(address, open);

	if (r.appliance.detected)
		qCInfo(LC_NET).noquote() << "[probePorts]" << address << "looks like" << r.appliance.kind
								 << (r.appliance.confirmed ? "(confirmed)" : "(ports only)");
	return r;
}
