#pragma once
#include <QDateTime>
#include <QString>
#include <QVector>

#include "include/types.hpp"
#include "include/common_path.hpp"
#include "policy/CategorizationPolicy.hpp"
#include "services/HistoryStore.hpp"

// Merges one discovery snapshot into the tracked set.
//
// Writes go through HistoryStore one call at a time; the first failing call
// stops the cycle and reconcile() returns false with the store's message.
// Updates committed before the failure stay committed.
class ReconciliationEngine {
public:
	ReconciliationEngine(HistoryStore* store, CategorizationPolicy policy = {},
						 int graceScans = GRACE_SCANS);

	bool reconcile(const QVector<DiscoveredDevice>& current,
				   const QVector<TrackedDevice>& previous,
				   qint64 scanId, const QDateTime& now,
				   ReconcileResult* out, QString* error = nullptr);

	// Startup seed: one tracked entry per stored device, grace bookkeeping
	// restored from consecutive_offline
	QVector<TrackedDevice> trackedFromHistory(const QVector<Device>& rows) const;

	int graceScans() const { return graceScans_; }
	void setGraceScans(int n) { graceScans_ = n; }

	const CategorizationPolicy& policy() const { return policy_; }

private:
	EnrichedDevice enrich(const Device& history, bool online, const CategoryDecision& d) const;
	CategorizationLogEntry logEntry(qint64 scanId, const Device& history, bool online,
									const CategoryDecision& d, const QDateTime& now) const;
	bool fail(const char* where, QString* error) const;

	HistoryStore*			store_;
	CategorizationPolicy	policy_;
	int						graceScans_;
};
