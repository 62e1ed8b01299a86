#pragma once
#include <memory>
#include <QByteArray>
#include <QHostAddress>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QTcpServer>
#include <QTcpSocket>

#include "hub/BroadcastHub.hpp"

class QThread;
class QueryService;

// One connected client. Events and replies go out as one compact JSON
// object per line.
class TcpSubscriber : public QObject, public Subscriber {
	Q_OBJECT
public:
	explicit TcpSubscriber(QTcpSocket* socket, QObject* parent = nullptr);
	~TcpSubscriber() override;

	bool deliver(const QJsonObject& event) override;
	QString describe() const override { return peer_; }

	bool sendJsonLine(const QJsonObject& obj);
	bool isConnected() const;

signals:
	void lineReceived(const QByteArray& line);
	void disconnected();

private slots:
	void onReadyRead();

private:
	QPointer<QTcpSocket> socket_;
	QString peer_;
};

// Accepts subscribers, sends them initial_state, registers them with the
// hub and answers their requests
class SubscriberServer : public QObject {
	Q_OBJECT
public:
	SubscriberServer(BroadcastHub* hub, QueryService* query, QObject* parent = nullptr);
	~SubscriberServer() override;

	bool listen(const QHostAddress& address, quint16 port);
	void close();

	quint16 serverPort() const { return server_.serverPort(); }
	QString errorString() const { return server_.errorString(); }
	int clientCount() const { return clients_.size(); }
	int activePortScans() const { return portScans_.size(); }

private slots:
	void onNewConnection();

private:
	void handleCommand_(TcpSubscriber* client, const QByteArray& line);
	void startPortScan_(TcpSubscriber* client, const QString& address, const QVector<int>& ports);
	void dropClient_(TcpSubscriber* client);

	BroadcastHub*	hub_;
	QueryService*	query_;
	QTcpServer		server_;
	QVector<std::shared_ptr<TcpSubscriber>> clients_;
	QList<QThread*>	portScans_;		// joined by close()
};
