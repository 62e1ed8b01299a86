#pragma once
#include <optional>
#include <QObject>
#include <QTimer>

#include "include/states.hpp"
#include "include/types.hpp"

class BroadcastHub;
class ScannerContext;
class ScanWorker;

// Schedules scan cycles and publishes their lifecycle events.
//
// Two triggers share one path: a single-shot timer re-armed after every
// scheduled cycle, and requestScanNow(). At most one cycle is in flight;
// triggers arriving meanwhile collapse into one pending slot, where a
// scheduled trigger replaces a manual one.
class ScanOrchestrator : public QObject {
	Q_OBJECT
public:
	ScanOrchestrator(ScannerContext* ctx, BroadcastHub* hub, ScanWorker* worker,
					 QObject* parent = nullptr);

	// First scheduled cycle runs immediately
	void start();
	void stop();

	bool isRunning() const { return running_; }
	bool cycleInFlight() const { return inFlight_.has_value(); }
	bool hasPending() const { return pending_.has_value(); }

public slots:
	void requestScanNow();

signals:
	// queued to ScanWorker::runCycle
	void cycleRequested(States::ScanTrigger trigger);

	void cycleCompleted(States::ScanTrigger trigger, const ReconcileResult& result);
	void cycleAborted(States::ScanTrigger trigger, const QString& message);

private slots:
	void onTimeout();
	void onCycleFinished(States::ScanTrigger trigger, const CycleOutcome& outcome);
	void onCycleFailed(States::ScanTrigger trigger, const QString& message);

private:
	void trigger(States::ScanTrigger t);
	void dispatch(States::ScanTrigger t);
	void afterCycle(States::ScanTrigger t);
	void armTimer();

	ScannerContext*	ctx_;
	BroadcastHub*	hub_;
	ScanWorker*		worker_;
	QTimer			timer_;
	bool			running_ = false;

	std::optional<States::ScanTrigger>	inFlight_;
	std::optional<States::ScanTrigger>	pending_;
};
