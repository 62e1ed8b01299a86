#include "discovery/ArpCacheDiscovery.hpp"
#include <algorithm>
#include <QFile>
#include <QHostAddress>
#include <QHostInfo>
#include <QNetworkInterface>
#include <QRegularExpression>
#include <QTextStream>
#include <QDebug>

#include "log/lanwatch_logging.hpp"

ArpCacheDiscovery::ArpCacheDiscovery(QString arpTablePath, bool resolveNames)
	: arpTablePath_(std::move(arpTablePath)), resolveNames_(resolveNames)
{}

bool ArpCacheDiscovery::isUsableEntry(const QString& ip, const QString& flags, const QString& mac)
{
	const QString m = mac.toLower();

	if (QHostAddress(ip).isNull())							return false;
	if (flags == QLatin1String("0x0"))						return false;	// incomplete
	if (m == QLatin1String("00:00:00:00:00:00"))			return false;
	if (m == QLatin1String("ff:ff:ff:ff:ff:ff"))			return false;	// broadcast
	if (m.startsWith(QLatin1String("01:00:5e")))			return false;	// IPv4 multicast MAC
	if (ip.startsWith(QLatin1String("169.254.")))			return false;	// link-local
	if (ip.startsWith(QLatin1String("224.")))				return false;	// multicast
	return true;
}

QVector<DiscoveredDevice> ArpCacheDiscovery::parseArpTable(const QString& text)
{
	static const QRegularExpression ws(QStringLiteral("\\s+"));

	QVector<DiscoveredDevice> out;
	const QStringList lines = text.split(QLatin1Char('\n'));

	// 첫 줄은 헤더
	for (int i = 1; i < lines.size(); ++i) {
		const QStringList cols = lines[i].trimmed().split(ws, Qt::SkipEmptyParts);
		if (cols.size() < 4) continue;

		const QString& ip    = cols[0];
		const QString& flags = cols[2];
		const QString  mac   = cols[3].toLower();

		if (!isUsableEntry(ip, flags, mac)) {
			qCDebug(LC_NET) << "[parseArpTable] skip" << ip << flags << mac;
			continue;
		}

		DiscoveredDevice d;
		d.address    = ip;
		d.hardwareId = mac;
		out.push_back(d);
	}
	return out;
}

QString ArpCacheDiscovery::resolveLabel(const QString& address)
{
	const QHostInfo info = QHostInfo::fromName(address);
	if (info.error() != QHostInfo::NoError) return QStringLiteral("Unknown");

	const QString name = info.hostName();
	if (name.isEmpty() || name == address) return QStringLiteral("Unknown");
	return name;
}

QString ArpCacheDiscovery::localAddress()
{
	const auto ifaces = QNetworkInterface::allInterfaces();
	for (const QNetworkInterface& iface : ifaces) {
		const auto flags = iface.flags();
		if (!(flags & QNetworkInterface::IsUp) || !(flags & QNetworkInterface::IsRunning)) continue;
		if (flags & QNetworkInterface::IsLoopBack) continue;

		for (const QNetworkAddressEntry& e : iface.addressEntries()) {
			const QHostAddress a = e.ip();
			if (a.protocol() == QAbstractSocket::IPv4Protocol && !a.isLoopback())
				return a.toString();
		}
	}
	return QStringLiteral("127.0.0.1");
}

bool ArpCacheDiscovery::scan(DiscoveryReport* out, QString* error)
{
	QFile f(arpTablePath_);
	if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
		const QString why = QStringLiteral("cannot read %1: %2").arg(arpTablePath_, f.errorString());
		qCWarning(LC_NET).noquote() << "[ArpCacheDiscovery]" << why;
		if (error) *error = why;
		return false;
	}
	const QString text = QTextStream(&f).readAll();
	f.close();

	QVector<DiscoveredDevice> devices = parseArpTable(text);

	if (resolveNames_) {
		for (DiscoveredDevice& d : devices)
			d.label = resolveLabel(d.address);
	}

	if (includeLocalHost_) {
		const QString local = localAddress();
		const bool present = std::any_of(devices.cbegin(), devices.cend(),
										 [&](const DiscoveredDevice& d){ return d.address == local; });
		if (!present) {
			DiscoveredDevice self;
			self.address    = local;
			self.hardwareId = QStringLiteral("local");
			self.label      = QStringLiteral("%1 (This Device)").arg(QHostInfo::localHostName());
			devices.prepend(self);
		}
	}

	qCInfo(LC_NET) << "[ArpCacheDiscovery] found" << devices.size() << "devices in" << arpTablePath_;

	if (out) {
		out->devices = std::move(devices);
		out->method  = QString::fromLatin1(kMethod);
	}
	return true;
}
