#pragma once
#include <QObject>
#include <QString>

#include "include/states.hpp"
#include "include/types.hpp"
#include "engine/ReconciliationEngine.hpp"

class DiscoverySource;
class HistoryStore;
class ScannerContext;

// Runs discovery + scan event + reconciliation. Lives on its own QThread
// and is driven only through queued calls, so one cycle runs at a time.
class ScanWorker : public QObject {
	Q_OBJECT
public:
	ScanWorker(DiscoverySource* discovery, HistoryStore* store, ScannerContext* ctx,
			   ReconciliationEngine engine, QObject* parent = nullptr);

	const ReconciliationEngine& engine() const { return engine_; }

public slots:
	void runCycle(States::ScanTrigger trigger);

signals:
	void cycleFinished(States::ScanTrigger trigger, const CycleOutcome& outcome);
	void cycleFailed(States::ScanTrigger trigger, const QString& message);

private:
	// A reconcile that failed part way may have written some rows already;
	// the tracked set is rebuilt from what the store actually holds.
	void resyncFromHistory();

	DiscoverySource*		discovery_;
	HistoryStore*			store_;
	ScannerContext*			ctx_;
	ReconciliationEngine	engine_;
};
