#include "discovery/PortProbe.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include <QHash>
#include <QTcpSocket>
#include <QDebug>

#include "log/lanwatch_logging.hpp"

QVector<PortResult> PortProbe::openPorts(const QString& address, const QVector<int>& ports)
{
	QVector<PortResult> out;
	for (const PortResult& r : probe(address, ports)) {
		if (r.status == QLatin1String("open")) out.push_back(r);
	}
	return out;
}

TcpPortProbe::TcpPortProbe(int timeoutMs, int maxWorkers, int retries)
	: timeoutMs_(timeoutMs > 0 ? timeoutMs : 2000)
	, maxWorkers_(maxWorkers > 0 ? maxWorkers : 1)
	, retries_(retries >= 0 ? retries : 0)
{}

QString TcpPortProbe::serviceName(int port)
{
	static const QHash<int, QString> kServices = {
		{20, "FTP Data Transfer"},		{21, "FTP Control"},
		{22, "SSH (Secure Shell)"},		{23, "Telnet"},
		{25, "SMTP (Email)"},			{53, "DNS"},
		{67, "DHCP Server"},			{68, "DHCP Client"},
		{80, "HTTP (Web)"},				{110, "POP3 (Email)"},
		{123, "NTP (Time)"},			{143, "IMAP (Email)"},
		{161, "SNMP"},					{443, "HTTPS (Secure Web)"},
		{445, "SMB/CIFS (File Sharing)"},{465, "SMTPS (Secure Email)"},
		{514, "Syslog"},				{587, "SMTP (Email Submission)"},
		{631, "IPP (Printing)"},		{993, "IMAPS (Secure Email)"},
		{995, "POP3S (Secure Email)"},	{1433, "MS SQL Server"},
		{1521, "Oracle Database"},		{3306, "MySQL Database"},
		{3389, "RDP (Remote Desktop)"},	{5000, "UPnP"},
		{5432, "PostgreSQL Database"},	{5900, "VNC (Remote Desktop)"},
		{6379, "Redis Database"},		{8080, "HTTP Proxy/Alt"},
		{8443, "HTTPS Alt"},			{8888, "HTTP Alt"},
		{9000, "Various Services"},		{27017, "MongoDB Database"},
	};
	return kServices.value(port, QStringLiteral("Unknown Service"));
}

const QVector<int>& TcpPortProbe::defaultPorts()
{
	static const QVector<int> kPorts = {
		21, 22, 23, 25, 53, 80, 110, 143, 443, 445, 465, 587, 631,
		993, 995, 3306, 3389, 5432, 5900, 8080, 8443
	};
	return kPorts;
}

PortResult TcpPortProbe::probeOne(const QString& address, int port) const
{
	PortResult r;
	r.port    = port;
	r.service = serviceName(port);
	r.status  = QStringLiteral("error");

	for (int attempt = 0; attempt <= retries_; ++attempt) {
		QTcpSocket sock;
		sock.connectToHost(address, static_cast<quint16>(port));

		if (sock.waitForConnected(timeoutMs_)) {
			sock.abort();
			r.status = QStringLiteral("open");
			return r;
		}

		const auto err = sock.error();
		sock.abort();

		if (err == QAbstractSocket::ConnectionRefusedError) {
			r.status = QStringLiteral("closed");
			return r;
		}
		// 타임아웃/기타 오류는 한 번 더
		r.status = (err == QAbstractSocket::SocketTimeoutError) ? QStringLiteral("filtered")
																: QStringLiteral("error");
		qCDebug(LC_NET) << "[probeOne]" << address << port << "attempt" << attempt << r.status;
	}
	return r;
}

QVector<PortResult> TcpPortProbe::probe(const QString& address, const QVector<int>& ports)
{
	QVector<PortResult> results;
	if (ports.isEmpty()) return results;

	qCInfo(LC_NET) << "[probe] start" << address << "ports=" << ports.size()
				   << "timeoutMs=" << timeoutMs_ << "workers=" << maxWorkers_;

	std::atomic<int> next{0};
	std::mutex mtx;
	results.reserve(ports.size());

	const int workers = std::min<int>(maxWorkers_, ports.size());
	std::vector<std::thread> pool;
	pool.reserve(workers);

	for (int w = 0; w < workers; ++w) {
		pool.emplace_back([&]() {
			for (int i = next.fetch_add(1); i < ports.size(); i = next.fetch_add(1)) {
				PortResult r = probeOne(address, ports[i]);
				std::lock_guard<std::mutex> lk(mtx);
				results.push_back(std::move(r));
			}
		});
	}
	for (auto& t : pool) t.join();

	std::sort(results.begin(), results.end(),
			  [](const PortResult& a, const PortResult& b){ return a.port < b.port; });

	const auto open = std::count_if(results.cbegin(), results.cend(),
									[](const PortResult& r){ return r.status == QLatin1String("open"); });
	qCInfo(LC_NET) << "[probe] done" << address << "open=" << open;
	return results;
}
