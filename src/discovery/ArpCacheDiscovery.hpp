#pragma once
#include <QString>
#include <QVector>

#include "discovery/DiscoverySource.hpp"
#include "include/common_path.hpp"

// Reads the kernel neighbour table (/proc/net/arp) instead of probing
class ArpCacheDiscovery : public DiscoverySource {
public:
	explicit ArpCacheDiscovery(QString arpTablePath = QStringLiteral(ARP_TABLE_PATH),
							   bool resolveNames = true);

	bool scan(DiscoveryReport* out, QString* error) override;

	void setResolveNames(bool on) { resolveNames_ = on; }
	void setIncludeLocalHost(bool on) { includeLocalHost_ = on; }
	const QString& arpTablePath() const { return arpTablePath_; }

	// IP address / HW type / Flags / HW address / Mask / Device, header first
	static QVector<DiscoveredDevice> parseArpTable(const QString& text);
	static bool isUsableEntry(const QString& ip, const QString& flags, const QString& mac);

	static QString resolveLabel(const QString& address);
	static QString localAddress();

	static constexpr const char* kMethod = "arp_cache_file";

private:
	QString arpTablePath_;
	bool	resolveNames_;
	bool	includeLocalHost_ = true;
};
