#include "engine/ReconciliationEngine.hpp"
#include <QHash>
#include <QSet>
#include <QDebug>

#include "log/lanwatch_logging.hpp"

ReconciliationEngine::ReconciliationEngine(HistoryStore* store, CategorizationPolicy policy, int graceScans)
	: store_(store), policy_(std::move(policy)), graceScans_(graceScans > 0 ? graceScans : 1)
{}

bool ReconciliationEngine::fail(const char* where, QString* error) const
{
	const QString msg = store_ ? store_->lastError() : QStringLiteral("no history store");
	qCWarning(LC_ENGINE).noquote() << "[reconcile]" << where << "failed:" << msg;
	if (error) *error = msg.isEmpty() ? QStringLiteral("%1 failed").arg(where) : msg;
	return false;
}

EnrichedDevice ReconciliationEngine::enrich(const Device& h, bool online, const CategoryDecision& d) const
{
	EnrichedDevice e;
	e.address         = h.address;
	e.hardwareId      = h.hardwareId;
	e.label           = h.label;
	e.status          = online ? QStringLiteral("online") : QStringLiteral("offline");
	e.category        = d.category;
	e.reason          = d.reason;
	e.firstSeen       = h.firstSeen;
	e.lastSeen        = h.lastSeen;
	e.totalScans      = h.totalScans;
	e.scansSeenOnline = h.scansSeenOnline;
	e.notes           = h.notes;

	if (h.totalScans == 0) e.appearanceRate = online ? 1.0 : 0.0;
	else                   e.appearanceRate = CategorizationPolicy::appearanceRate(h.totalScans, h.scansSeenOnline);
	return e;
}

CategorizationLogEntry ReconciliationEngine::logEntry(qint64 scanId, const Device& h, bool online,
													  const CategoryDecision& d, const QDateTime& now) const
{
	CategorizationLogEntry l;
	l.scanId             = scanId;
	l.address            = h.address;
	l.totalScans         = h.totalScans;
	l.scansSeenOnline    = h.scansSeenOnline;
	l.consecutiveOnline  = h.consecutiveOnline;
	l.consecutiveOffline = h.consecutiveOffline;
	l.appearanceRate     = CategorizationPolicy::appearanceRate(h.totalScans, h.scansSeenOnline);
	l.category           = d.category;
	l.online             = online;
	l.reason             = d.reason;
	l.loggedAt           = now;
	return l;
}

bool ReconciliationEngine::reconcile(const QVector<DiscoveredDevice>& current,
									 const QVector<TrackedDevice>& previous,
									 qint64 scanId, const QDateTime& now,
									 ReconcileResult* out, QString* error)
{
	if (!store_) return fail("store", error);

	ReconcileResult r;

	QHash<QString, int> prevIndex;
	for (int i = 0; i < previous.size(); ++i) {
		if (!prevIndex.contains(previous[i].device.address))
			prevIndex.insert(previous[i].device.address, i);
	}

	if (!store_->bumpTotalScansForAllKnownDevices())
		return fail("bumpTotalScansForAllKnownDevices", error);

	// 1) 이번 스캔에서 발견된 장치
	QSet<QString> seen;
	for (const DiscoveredDevice& d : current) {
		if (d.address.isEmpty() || seen.contains(d.address)) continue;
		seen.insert(d.address);

		if (!store_->recordOnlineObservation(d.address, d.hardwareId, d.label, now))
			return fail("recordOnlineObservation", error);

		std::optional<Device> history;
		if (!store_->getDevice(d.address, &history))
			return fail("getDevice", error);

		Device h;
		if (history) {
			h = *history;
		} else {
			h.address    = d.address;
			h.hardwareId = d.hardwareId;
			h.label      = d.label;
		}

		const CategoryDecision decision = policy_.classify(history, /*online=*/true);

		TrackedDevice t;
		t.device       = enrich(h, true, decision);
		t.deviceStatus = prevIndex.contains(d.address) ? DeviceStatus::Existing : DeviceStatus::New;
		t.missedScans  = 0;

		if (!store_->appendCategorizationLog(logEntry(scanId, h, true, decision, now)))
			return fail("appendCategorizationLog", error);

		if (t.deviceStatus == DeviceStatus::New) ++r.newCount;
		qCDebug(LC_ENGINE) << "[reconcile] online" << d.address << deviceStatusName(t.deviceStatus)
						   << deviceCategoryName(decision.category) << "-" << decision.reason;
		r.devices.push_back(t);
	}
	r.onlineCount = seen.size();

	// 2) 이전에 추적하던 장치 중 이번에 안 보인 것
	QSet<QString> handled;
	for (const TrackedDevice& p : previous) {
		const QString& addr = p.device.address;
		if (addr.isEmpty() || seen.contains(addr) || handled.contains(addr)) continue;
		handled.insert(addr);

		if (!store_->recordOfflineObservation(addr, p.device.hardwareId, p.device.label, now))
			return fail("recordOfflineObservation", error);

		std::optional<Device> history;
		if (!store_->getDevice(addr, &history))
			return fail("getDevice", error);

		const int missed = p.missedScans + 1;

		if (missed < graceScans_) {
			// 유예 구간: 이전 레코드 유지, 카운터만 갱신
			TrackedDevice t = p;
			t.deviceStatus = DeviceStatus::Existing;
			t.missedScans  = missed;
			if (history) {
				t.device.lastSeen        = history->lastSeen;
				t.device.totalScans      = history->totalScans;
				t.device.scansSeenOnline = history->scansSeenOnline;
				t.device.appearanceRate  = CategorizationPolicy::appearanceRate(history->totalScans,
																				history->scansSeenOnline);
				t.device.notes           = history->notes;
			}
			qCDebug(LC_ENGINE) << "[reconcile] grace" << addr << "missed" << missed << "of" << graceScans_;
			r.devices.push_back(t);
			continue;
		}

		Device h;
		if (history) {
			h = *history;
		} else {
			h.address    = addr;
			h.hardwareId = p.device.hardwareId;
			h.label      = p.device.label;
		}

		const CategoryDecision decision = history ? policy_.classify(history, /*online=*/false)
												  : policy_.classify(0, 0, 0, /*online=*/false);

		TrackedDevice t;
		t.device       = enrich(h, false, decision);
		t.deviceStatus = DeviceStatus::Offline;
		t.missedScans  = missed;

		CategoryDecision logged = decision;
		logged.reason = QStringLiteral("missed %1 scans: %2").arg(missed).arg(decision.reason);
		if (!store_->appendCategorizationLog(logEntry(scanId, h, false, logged, now)))
			return fail("appendCategorizationLog", error);

		++r.offlineCount;
		qCDebug(LC_ENGINE) << "[reconcile] offline" << addr << "missed" << missed << "-" << decision.reason;
		r.devices.push_back(t);
	}

	qCInfo(LC_ENGINE) << "[reconcile] scan" << scanId << "online=" << r.onlineCount
					  << "new=" << r.newCount << "offline=" << r.offlineCount
					  << "tracked=" << r.devices.size();

	if (out) *out = std::move(r);
	return true;
}

QVector<TrackedDevice> ReconciliationEngine::trackedFromHistory(const QVector<Device>& rows) const
{
	QVector<TrackedDevice> out;
	out.reserve(rows.size());

	for (const Device& h : rows) {
		const bool offline = h.consecutiveOffline >= graceScans_;
		const CategoryDecision d = policy_.classify(std::optional<Device>(h), !offline);

		TrackedDevice t;
		t.device       = enrich(h, !offline, d);
		t.deviceStatus = offline ? DeviceStatus::Offline : DeviceStatus::Existing;
		t.missedScans  = h.consecutiveOffline;
		out.push_back(t);
	}
	return out;
}
