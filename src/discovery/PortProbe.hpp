#pragma once
#include <QString>
#include <QVector>

struct PortResult {
	int		port = 0;
	QString	status;		// "open" | "closed" | "filtered" | "error"
	QString	service;
};

class PortProbe {
public:
	virtual ~PortProbe() = default;

	// Every requested port, sorted by port number
	virtual QVector<PortResult> probe(const QString& address, const QVector<int>& ports) = 0;

	// Only the open ones
	QVector<PortResult> openPorts(const QString& address, const QVector<int>& ports);
};

// TCP connect probe over a bounded pool of worker threads
class TcpPortProbe : public PortProbe {
public:
	explicit TcpPortProbe(int timeoutMs = 2000, int maxWorkers = 20, int retries = 1);

	QVector<PortResult> probe(const QString& address, const QVector<int>& ports) override;

	PortResult probeOne(const QString& address, int port) const;

	static QString serviceName(int port);
	static const QVector<int>& defaultPorts();

private:
	int timeoutMs_;
	int maxWorkers_;
	int retries_;
};
