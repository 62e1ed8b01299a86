#include "hub/SubscriberServer.hpp"
#include <utility>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QThread>
#include <QDebug>

#include "hub/Events.hpp"
#include "include/scan_params.hpp"
#include "services/QueryService.hpp"
#include "log/lanwatch_logging.hpp"

TcpSubscriber::TcpSubscriber(QTcpSocket* socket, QObject* parent)
	: QObject(parent), socket_(socket)
{
	socket_->setParent(this);
	peer_ = QStringLiteral("%1:%2").arg(socket_->peerAddress().toString()).arg(socket_->peerPort());

	connect(socket_, &QTcpSocket::readyRead, this, &TcpSubscriber::onReadyRead);
	connect(socket_, &QTcpSocket::disconnected, this, &TcpSubscriber::disconnected);
}

TcpSubscriber::~TcpSubscriber()
{
	if (socket_) {
		socket_->disconnect(this);
		socket_->abort();
	}
}

bool TcpSubscriber::isConnected() const
{
	return socket_ && socket_->state() == QAbstractSocket::ConnectedState;
}

bool TcpSubscriber::sendJsonLine(const QJsonObject& obj)
{
	if (!isConnected()) {
		qCDebug(LC_HUB) << "[sendJsonLine]" << peer_ << "not connected";
		return false;
	}

	const QByteArray line = QJsonDocument(obj).toJson(QJsonDocument::Compact) + '\n';
	const qint64 n = socket_->write(line);
	if (n != line.size()) {
		qCWarning(LC_HUB) << "[sendJsonLine]" << peer_ << "write failed:" << socket_->errorString();
		return false;
	}
	return true;
}

bool TcpSubscriber::deliver(const QJsonObject& event)
{
	return sendJsonLine(event);
}

void TcpSubscriber::onReadyRead()
{
	while (isConnected() && socket_->canReadLine()) {
		const QByteArray line = socket_->readLine().trimmed();
		if (!line.isEmpty()) emit lineReceived(line);
	}

	if (isConnected() && socket_->bytesAvailable() > scan::MAX_REQUEST_LINE_BYTES) {
		qCWarning(LC_HUB) << "[onReadyRead]" << peer_ << "no newline in" << socket_->bytesAvailable()
						  << "bytes, disconnecting";
		sendJsonLine(Events::error(QStringLiteral("request line too long (max %1 bytes)")
									   .arg(scan::MAX_REQUEST_LINE_BYTES)));
		socket_->disconnectFromHost();
	}
}

SubscriberServer::SubscriberServer(BroadcastHub* hub, QueryService* query, QObject* parent)
	: QObject(parent), hub_(hub), query_(query)
{
	connect(&server_, &QTcpServer::newConnection, this, &SubscriberServer::onNewConnection);
}

SubscriberServer::~SubscriberServer()
{
	close();
}

bool SubscriberServer::listen(const QHostAddress& address, quint16 port)
{
	if (!server_.listen(address, port)) {
		qCCritical(LC_HUB) << "[listen]" << address.toString() << port << "failed:" << server_.errorString();
		return false;
	}
	qCInfo(LC_HUB) << "[listen] subscribers on" << address.toString() << server_.serverPort();
	return true;
}

void SubscriberServer::close()
{
	server_.close();

	// 진행 중인 포트 스캔 스레드 정리
	const QList<QThread*> scans = std::exchange(portScans_, {});
	for (QThread* th : scans) {
		th->wait();
		th->deleteLater();
	}

	for (const auto& c : clients_) {
		if (hub_) hub_->unsubscribe(c.get());
	}
	clients_.clear();
}

void SubscriberServer::onNewConnection()
{
	while (QTcpSocket* sock = server_.nextPendingConnection()) {
		// QObject 수명은 deleteLater로 이벤트 루프에 맡김
		std::shared_ptr<TcpSubscriber> client(new TcpSubscriber(sock),
											  [](TcpSubscriber* p) { p->deleteLater(); });
		TcpSubscriber* raw = client.get();

		connect(raw, &TcpSubscriber::lineReceived, this,
				[this, raw](const QByteArray& line) { handleCommand_(raw, line); });
		connect(raw, &TcpSubscriber::disconnected, this,
				[this, raw]() { dropClient_(raw); });

		clients_.push_back(client);

		if (query_) raw->sendJsonLine(Events::initialState(query_->currentDevices()));
		if (hub_) hub_->subscribe(client);

		qCInfo(LC_HUB).noquote() << "[onNewConnection]" << raw->describe() << "(clients:" << clients_.size() << ")";
	}
}

void SubscriberServer::dropClient_(TcpSubscriber* client)
{
	if (hub_) hub_->unsubscribe(client);
	for (int i = 0; i < clients_.size(); ++i) {
		if (clients_[i].get() == client) {
			clients_.removeAt(i);
			break;
		}
	}
	qCInfo(LC_HUB) << "[dropClient] remaining:" << clients_.size();
}

void SubscriberServer::handleCommand_(TcpSubscriber* client, const QByteArray& line)
{
	QJsonParseError pe;
	const QJsonDocument jd = QJsonDocument::fromJson(line, &pe);
	if (pe.error != QJsonParseError::NoError || !jd.isObject()) {
		client->sendJsonLine(Events::error(QStringLiteral("invalid JSON: %1").arg(pe.errorString())));
		return;
	}

	const QJsonObject msg = jd.object();
	const QString type = msg.value("type").toString();
	qCDebug(LC_HUB).noquote() << "[handleCommand_]" << client->describe() << type;

	if (type == "scan_now") {
		if (hub_) hub_->requestScanNow();
		return;
	}

	if (!query_) {
		client->sendJsonLine(Events::error(QStringLiteral("queries unavailable")));
		return;
	}

	if (type == "get_devices") {
		client->sendJsonLine(Events::devicesReply(query_->currentDevices()));
		return;
	}

	if (type == "get_stats") {
		StatsReport r; QString why;
		if (query_->stats(QDateTime::currentDateTimeUtc(), &r, &why))
			client->sendJsonLine(Events::statsReply(r));
		else
			client->sendJsonLine(Events::failure("stats", why));
		return;
	}

	if (type == "get_log") {
		const int limit = msg.value("limit").toInt(scan::LOG_LIMIT_DEFAULT);
		QVector<CategorizationLogEntry> rows; int total = 0; QString why;
		if (query_->categorizationLog(limit, &rows, &total, &why))
			client->sendJsonLine(Events::logReply(rows, total));
		else
			client->sendJsonLine(Events::failure("categorization_log", why));
		return;
	}

	if (type == "get_scans") {
		const int limit = msg.value("limit").toInt(scan::LOG_LIMIT_DEFAULT);
		QVector<ScanEvent> rows; QString why;
		if (query_->recentScans(limit, &rows, &why))
			client->sendJsonLine(Events::scansReply(rows));
		else
			client->sendJsonLine(Events::failure("scans", why));
		return;
	}

	if (type == "get_system_logs") {
		SystemLogQuery q;
		q.limit    = msg.value("limit").toInt(scan::LOG_LIMIT_DEFAULT);
		q.minLevel = msg.value("min_level").toInt(0);
		q.tag      = msg.value("tag").toString();
		q.since    = msg.value("since").toString();
		QVector<SystemLog> rows; int total = 0; QString why;
		if (query_->systemLogs(q, &rows, &total, &why))
			client->sendJsonLine(Events::systemLogsReply(rows, total));
		else
			client->sendJsonLine(Events::failure("system_logs", why));
		return;
	}

	if (type == "update_notes") {
		const NotesResult r = query_->updateNotes(msg.value("address").toString(),
												  msg.value("notes").toString());
		client->sendJsonLine(Events::notesReply(r));
		return;
	}

	if (type == "scan_ports") {
		const QString address = msg.value("address").toString();
		if (QHostAddress(address).isNull()) {
			client->sendJsonLine(Events::error(QStringLiteral("scan_ports: invalid address '%1'").arg(address)));
			return;
		}
		QVector<int> ports;
		for (const QJsonValue& v : msg.value("ports").toArray()) {
			const int p = v.toInt(-1);
			if (p < 1 || p > 65535) {
				client->sendJsonLine(Events::error(QStringLiteral("scan_ports: invalid port")));
				return;
			}
			ports.push_back(p);
		}
		startPortScan_(client, address, ports);
		return;
	}

	client->sendJsonLine(Events::error(QStringLiteral("unknown request type: %1").arg(type)));
}

void SubscriberServer::startPortScan_(TcpSubscriber* client, const QString& address, const QVector<int>& ports)
{
	QPointer<TcpSubscriber> target(client);
	QueryService* query = query_;

	// 블로킹 connect 프로브는 별도 스레드에서
	QThread* th = QThread::create([this, target, query, address, ports]() {
		const PortScanReport r = query->probePorts(address, ports);
		const QJsonObject reply = Events::portScanReply(r);
		QMetaObject::invokeMethod(this, [target, reply]() {
			if (target) target->sendJsonLine(reply);
		}, Qt::QueuedConnection);
	});
	portScans_.push_back(th);
	connect(th, &QThread::finished, this, [this, th]() {
		if (portScans_.removeOne(th)) th->deleteLater();
	});
	th->start();
}
