#include "AppPresenter.hpp"
#include <QDebug>

#include "engine/ReconciliationEngine.hpp"
#include "log/SystemLogger.hpp"
#include "logger.hpp"

AppPresenter::AppPresenter(const ScanConfig& cfg, QObject* p)
    : QObject(p)
    , cfg_(cfg)
    , db_(std::make_unique<QSqliteService>(cfg.dbPath))
    , ctx_(cfg.scanIntervalSec)
    , discovery_(cfg.arpTablePath, cfg.resolveNames)
    , probe_(cfg.probeTimeoutMs, cfg.probeWorkers)
{
	query_ = std::make_unique<QueryService>(db_.get(), &ctx_, &probe_, CategorizationPolicy(cfg_.policy));

	hub_ = new BroadcastHub(this);

	scanThread = new QThread(this);
	scanThread->setObjectName(QStringLiteral("scan"));

	ReconciliationEngine engine(db_.get(), CategorizationPolicy(cfg_.policy), cfg_.graceScans);
	scanWorker = new ScanWorker(&discovery_, db_.get(), &ctx_, engine);

	// 스레드 이동
	scanWorker->moveToThread(scanThread);
	// 수명 관리
	connect(scanThread, &QThread::finished, scanWorker, &QObject::deleteLater);

	orchestrator_ = new ScanOrchestrator(&ctx_, hub_, scanWorker, this);
	server_ = new SubscriberServer(hub_, query_.get(), this);

	connect(hub_, &BroadcastHub::subscriberDropped, this, [](const QString& who) {
		SystemLogger::warn("HUB", QStringLiteral("subscriber dropped: %1").arg(who));
	});

	LOG_DEBUG(QStringLiteral("db: %1 interval: %2 grace: %3")
	              .arg(db_->dbPath()).arg(cfg_.scanIntervalSec).arg(cfg_.graceScans));
}

bool AppPresenter::seedFromHistory(QString* error)
{
	QVector<Device> rows;
	if (!db_->getAllDevices(&rows)) {
		if (error) *error = db_->lastError();
		return false;
	}

	ctx_.seedPrevious(scanWorker->engine().trackedFromHistory(rows));
	LOG_INFO(QStringLiteral("restored %1 tracked devices").arg(rows.size()));
	return true;
}

bool AppPresenter::startAllServices(QString* error)
{
	if (started_) return true;

	if (!db_->initializeDatabase()) {
		if (error) *error = QStringLiteral("database: %1").arg(db_->lastError());
		return false;
	}

	// 시스템로거 준비
	SystemLogger::init(db_->dbPath());
	SystemLogger::info("APP", "Logger initialized");

	if (!seedFromHistory(error)) return false;

	if (!server_->listen(QHostAddress(cfg_.listenAddress), cfg_.listenPort)) {
		if (error) *error = QStringLiteral("listen %1:%2: %3")
		                        .arg(cfg_.listenAddress).arg(cfg_.listenPort).arg(server_->errorString());
		return false;
	}

	if (!scanThread->isRunning()) {
		scanThread->start();
	}
	orchestrator_->start();

	SystemLogger::info("APP", QStringLiteral("listening on %1:%2").arg(cfg_.listenAddress).arg(server_->serverPort()));
	started_ = true;
	return true;
}

void AppPresenter::stopAllServices()
{
	orchestrator_->stop();
	server_->close();

	if (scanThread->isRunning()) {
		scanThread->quit();
		scanThread->wait();
	}

	if (started_) {
		SystemLogger::info("APP", "services stopped");
		started_ = false;
	}
}

AppPresenter::~AppPresenter()
{
		stopAllServices();
}
