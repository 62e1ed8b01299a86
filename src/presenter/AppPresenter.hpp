#pragma once

#include <memory>
#include <QObject>
#include <QThread>

#include "config/ScanConfig.hpp"
#include "discovery/ArpCacheDiscovery.hpp"
#include "discovery/PortProbe.hpp"
#include "hub/BroadcastHub.hpp"
#include "hub/SubscriberServer.hpp"
#include "services/QSqliteService.hpp"
#include "services/QueryService.hpp"
#include "services/ScannerContext.hpp"
#include "services/ScanOrchestrator.hpp"
#include "services/ScanWorker.hpp"

class AppPresenter : public QObject {
		Q_OBJECT

public:
		explicit AppPresenter(const ScanConfig& cfg, QObject* parent = nullptr);
		~AppPresenter();

		// DB 준비 -> 이전 상태 복원 -> 스캔 스레드 -> 서버 -> 첫 스캔
		bool startAllServices(QString* error);
		void stopAllServices();

		ScannerContext& context() { return ctx_; }
		QueryService& queries() { return *query_; }
		BroadcastHub* hub() const { return hub_; }
		quint16 serverPort() const { return server_->serverPort(); }

private:
		bool seedFromHistory(QString* error);

		ScanConfig cfg_;

		std::unique_ptr<QSqliteService> db_;
		ScannerContext ctx_;
		ArpCacheDiscovery discovery_;
		TcpPortProbe probe_;
		std::unique_ptr<QueryService> query_;

		BroadcastHub* hub_;
		QThread* scanThread;
		ScanWorker* scanWorker;
		ScanOrchestrator* orchestrator_;
		SubscriberServer* server_;

		bool started_ = false;
};
