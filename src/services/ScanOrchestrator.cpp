#include "services/ScanOrchestrator.hpp"
#include <chrono>
#include <QDateTime>
#include <QDebug>

#include "hub/BroadcastHub.hpp"
#include "include/scan_params.hpp"
#include "hub/Events.hpp"
#include "services/ScannerContext.hpp"
#include "services/ScanWorker.hpp"
#include "log/lanwatch_logging.hpp"
#include "log/SystemLogger.hpp"

ScanOrchestrator::ScanOrchestrator(ScannerContext* ctx, BroadcastHub* hub, ScanWorker* worker, QObject* parent)
	: QObject(parent), ctx_(ctx), hub_(hub), worker_(worker)
{
	qRegisterMetaType<States::ScanTrigger>("States::ScanTrigger");
	qRegisterMetaType<ReconcileResult>("ReconcileResult");
	qRegisterMetaType<CycleOutcome>("CycleOutcome");

	timer_.setSingleShot(true);
	connect(&timer_, &QTimer::timeout, this, &ScanOrchestrator::onTimeout);

	if (worker_) {
		connect(this, &ScanOrchestrator::cycleRequested, worker_, &ScanWorker::runCycle, Qt::QueuedConnection);
		connect(worker_, &ScanWorker::cycleFinished, this, &ScanOrchestrator::onCycleFinished, Qt::QueuedConnection);
		connect(worker_, &ScanWorker::cycleFailed, this, &ScanOrchestrator::onCycleFailed, Qt::QueuedConnection);
	}
	if (hub_) {
		connect(hub_, &BroadcastHub::scanNowRequested, this, &ScanOrchestrator::requestScanNow);
	}
}

void ScanOrchestrator::start()
{
	if (running_) return;
	running_ = true;
	qCInfo(LC_SCAN) << "[start] continuous scanner, interval" << ctx_->scanInterval() << "s";
	SystemLogger::info("SCAN", QStringLiteral("scanner started (interval %1s)").arg(ctx_->scanInterval()));
	trigger(States::ScanTrigger::Scheduled);
}

void ScanOrchestrator::stop()
{
	running_ = false;
	timer_.stop();
	pending_.reset();
	qCInfo(LC_SCAN) << "[stop] scanner stopped";
}

void ScanOrchestrator::requestScanNow()
{
	trigger(States::ScanTrigger::Manual);
}

void ScanOrchestrator::onTimeout()
{
	trigger(States::ScanTrigger::Scheduled);
}

void ScanOrchestrator::trigger(States::ScanTrigger t)
{
	if (t == States::ScanTrigger::Scheduled && !running_) return;

	if (inFlight_) {
		// 진행 중이면 대기 슬롯 하나로 합침 (scheduled 우선)
		if (!pending_ || t == States::ScanTrigger::Scheduled) pending_ = t;
		qCDebug(LC_SCAN) << "[trigger]" << scanTriggerName(t) << "coalesced, pending ="
						 << scanTriggerName(*pending_);
		return;
	}
	dispatch(t);
}

void ScanOrchestrator::dispatch(States::ScanTrigger t)
{
	inFlight_ = t;
	if (!ctx_->beginScan()) {
		qCWarning(LC_SCAN) << "[dispatch] scanner already marked scanning, running" << scanTriggerName(t) << "anyway";
	}

	qCInfo(LC_SCAN) << "[dispatch]" << scanTriggerName(t) << "scan";
	if (hub_) hub_->publish(Events::scanStart(t));

	emit cycleRequested(t);
}

void ScanOrchestrator::onCycleFinished(States::ScanTrigger t, const CycleOutcome& outcome)
{
	const bool scheduled = (t == States::ScanTrigger::Scheduled);
	const ReconcileResult& r = outcome.result;

	ctx_->commitScan(r.devices, outcome.finishedAt, scheduled);

	qCInfo(LC_SCAN) << "[onCycleFinished]" << scanTriggerName(t) << "scan" << outcome.scanId
					<< "online=" << r.onlineCount << "new=" << r.newCount << "offline=" << r.offlineCount;

	if (hub_) {
		hub_->publish(Events::scanProgress(t, r));
		hub_->publish(Events::scanUpdate(r, ctx_->snapshot()));
	}

	if (r.newCount > 0 || r.offlineCount > 0) {
		SystemLogger::info("SCAN", QStringLiteral("%1 scan: %2 online, %3 new, %4 offline")
								   .arg(scanTriggerName(t)).arg(r.onlineCount).arg(r.newCount).arg(r.offlineCount));
	}

	emit cycleCompleted(t, r);
	afterCycle(t);
}

void ScanOrchestrator::onCycleFailed(States::ScanTrigger t, const QString& message)
{
	const bool scheduled = (t == States::ScanTrigger::Scheduled);
	ctx_->abortScan(QDateTime::currentDateTimeUtc(), scheduled);

	qCWarning(LC_SCAN).noquote() << "[onCycleFailed]" << scanTriggerName(t) << "scan failed:" << message;
	SystemLogger::error("SCAN", QStringLiteral("scan failed: %1").arg(message));

	if (hub_) hub_->publish(Events::scanError(message));

	emit cycleAborted(t, message);
	afterCycle(t);
}

void ScanOrchestrator::afterCycle(States::ScanTrigger t)
{
	inFlight_.reset();

	if (t == States::ScanTrigger::Scheduled && running_) armTimer();

	if (pending_) {
		const States::ScanTrigger next = *pending_;
		pending_.reset();
		if (next == States::ScanTrigger::Scheduled && !running_) return;
		dispatch(next);
	}
}

void ScanOrchestrator::armTimer()
{
	const int sec = qBound(1, ctx_->scanInterval(), scan::SCAN_INTERVAL_MAX_SEC);
	timer_.start(std::chrono::seconds(sec));
}
