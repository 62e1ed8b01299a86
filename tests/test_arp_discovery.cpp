#include "discovery/ArpCacheDiscovery.hpp"

#include <QCoreApplication>
#include <QFile>
#include <QTemporaryDir>

#include <algorithm>
#include <cassert>
#include <iostream>

namespace {

const char* kTable =
    "IP address       HW type     Flags       HW address            Mask     Device\n"
    "192.168.1.1      0x1         0x2         AA:BB:CC:DD:EE:01     *        eth0\n"
    "192.168.1.20     0x1         0x2         aa:bb:cc:dd:ee:14     *        eth0\n"
    "192.168.1.21     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
    "192.168.1.255    0x1         0x2         ff:ff:ff:ff:ff:ff     *        eth0\n"
    "224.0.0.251      0x1         0x2         01:00:5e:00:00:fb     *        eth0\n"
    "169.254.3.4      0x1         0x2         aa:bb:cc:dd:ee:99     *        eth0\n"
    "not-an-ip        0x1         0x2         aa:bb:cc:dd:ee:98     *        eth0\n"
    "short line\n"
    "\n"
    "10.0.0.7         0x1         0x6         aa:bb:cc:dd:ee:07     *        wlan0\n";

}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);

  // filters
  assert(ArpCacheDiscovery::isUsableEntry("192.168.1.5", "0x2", "aa:bb:cc:00:11:22"));
  assert(!ArpCacheDiscovery::isUsableEntry("192.168.1.5", "0x0", "aa:bb:cc:00:11:22"));
  assert(!ArpCacheDiscovery::isUsableEntry("192.168.1.5", "0x2", "FF:FF:FF:FF:FF:FF"));
  assert(!ArpCacheDiscovery::isUsableEntry("192.168.1.5", "0x2", "01:00:5E:7f:00:01"));
  assert(!ArpCacheDiscovery::isUsableEntry("169.254.0.1", "0x2", "aa:bb:cc:00:11:22"));
  assert(!ArpCacheDiscovery::isUsableEntry("224.0.0.1", "0x2", "aa:bb:cc:00:11:22"));
  assert(!ArpCacheDiscovery::isUsableEntry("garbage", "0x2", "aa:bb:cc:00:11:22"));

  // parsing skips the header and every unusable row
  const QVector<DiscoveredDevice> parsed = ArpCacheDiscovery::parseArpTable(QString::fromLatin1(kTable));
  assert(parsed.size() == 3);
  assert(parsed[0].address == "192.168.1.1" && parsed[0].hardwareId == "aa:bb:cc:dd:ee:01");
  assert(parsed[1].address == "192.168.1.20");
  assert(parsed[2].address == "10.0.0.7");
  for (const DiscoveredDevice& d : parsed) {
    assert(d.label == "Unknown" && d.status == "online");
  }
  assert(ArpCacheDiscovery::parseArpTable(QString()).isEmpty());

  QTemporaryDir tmp;
  assert(tmp.isValid());
  const QString path = tmp.filePath("arp");
  {
    QFile f(path);
    assert(f.open(QIODevice::WriteOnly | QIODevice::Text));
    f.write(kTable);
  }

  // file source without name lookups or the local host entry
  ArpCacheDiscovery source(path, false);
  source.setIncludeLocalHost(false);
  DiscoveryReport report;
  QString why;
  assert(source.scan(&report, &why));
  assert(report.method == "arp_cache_file");
  assert(report.devices.size() == 3);

  // the local host is put first when the table does not list it
  source.setIncludeLocalHost(true);
  assert(source.scan(&report, &why));
  const QString local = ArpCacheDiscovery::localAddress();
  assert(!local.isEmpty());
  const bool listed = std::any_of(parsed.cbegin(), parsed.cend(),
                                  [&](const DiscoveredDevice& d) { return d.address == local; });
  if (!listed) {
    assert(report.devices.size() == 4);
    assert(report.devices[0].address == local);
    assert(report.devices[0].hardwareId == "local");
    assert(report.devices[0].label.endsWith("(This Device)"));
  } else {
    assert(report.devices.size() == 3);
  }

  // unreadable table fails the scan
  ArpCacheDiscovery missing(tmp.filePath("does/not/exist"), false);
  DiscoveryReport untouched;
  untouched.method = "before";
  assert(!missing.scan(&untouched, &why));
  assert(why.contains("cannot read"));
  assert(untouched.method == "before" && untouched.devices.isEmpty());

  std::cout << "arp discovery test ok\n";
  return 0;
}
