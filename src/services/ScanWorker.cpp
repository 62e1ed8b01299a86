#include "services/ScanWorker.hpp"
#include <QDateTime>
#include <QThread>
#include <QDebug>

#include "discovery/DiscoverySource.hpp"
#include "services/HistoryStore.hpp"
#include "services/ScannerContext.hpp"
#include "log/lanwatch_logging.hpp"

ScanWorker::ScanWorker(DiscoverySource* discovery, HistoryStore* store, ScannerContext* ctx,
					   ReconciliationEngine engine, QObject* parent)
	: QObject(parent), discovery_(discovery), store_(store), ctx_(ctx), engine_(std::move(engine))
{}

void ScanWorker::runCycle(States::ScanTrigger trigger)
{
	qCDebug(LC_SCAN) << "[runCycle]" << scanTriggerName(trigger) << "on" << QThread::currentThread();

	if (!discovery_ || !store_ || !ctx_) {
		emit cycleFailed(trigger, QStringLiteral("scanner not configured"));
		return;
	}

	DiscoveryReport report;
	QString why;
	if (!discovery_->scan(&report, &why)) {
		emit cycleFailed(trigger, why.isEmpty() ? QStringLiteral("discovery failed") : why);
		return;
	}

	const QDateTime now = QDateTime::currentDateTimeUtc();

	CycleOutcome outcome;
	outcome.method = report.method;

	if (!store_->appendScanEvent(report.devices.size(), report.method, now, &outcome.scanId)) {
		emit cycleFailed(trigger, store_->lastError());
		return;
	}

	if (!engine_.reconcile(report.devices, ctx_->previous(), outcome.scanId, now, &outcome.result, &why)) {
		// 일부 기기는 이미 기록됐을 수 있음
		resyncFromHistory();
		emit cycleFailed(trigger, why);
		return;
	}

	outcome.finishedAt = QDateTime::currentDateTimeUtc();
	emit cycleFinished(trigger, outcome);
}

void ScanWorker::resyncFromHistory()
{
	QVector<Device> rows;
	if (!store_->getAllDevices(&rows)) {
		qCWarning(LC_SCAN).noquote() << "[resyncFromHistory] keeping previous devices:" << store_->lastError();
		return;
	}
	ctx_->seedPrevious(engine_.trackedFromHistory(rows));
	qCInfo(LC_SCAN) << "[resyncFromHistory] tracking" << rows.size() << "devices from history";
}
