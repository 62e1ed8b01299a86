#include "services/ScannerContext.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

namespace {

QVector<TrackedDevice> devices(int n) {
  QVector<TrackedDevice> out;
  for (int i = 0; i < n; ++i) {
    TrackedDevice t;
    t.device.address = QStringLiteral("10.1.0.%1").arg(i);
    out.push_back(t);
  }
  return out;
}

}  // namespace

int main() {
  ScannerContext ctx(30);
  const QDateTime t0 = QDateTime::fromString("2025-01-01T00:00:00.000Z", Qt::ISODateWithMs);

  ScanSnapshot s = ctx.snapshot();
  assert(s.devices.isEmpty() && !s.scanning && s.scanInterval == 30);
  assert(!s.lastScan.isValid() && !s.nextScan.isValid());

  // only one cycle can be marked in flight
  assert(ctx.beginScan());
  assert(!ctx.beginScan());
  assert(ctx.isScanning());

  // scheduled commit advances next_scan
  ctx.commitScan(devices(3), t0, true);
  s = ctx.snapshot();
  assert(!s.scanning && s.devices.size() == 3 && ctx.previous().size() == 3);
  assert(s.lastScan == t0 && s.nextScan == t0.addSecs(30));

  // manual commit leaves it untouched
  assert(ctx.beginScan());
  ctx.commitScan(devices(1), t0.addSecs(10), false);
  s = ctx.snapshot();
  assert(s.devices.size() == 1 && s.lastScan == t0.addSecs(10) && s.nextScan == t0.addSecs(30));

  // failed cycle keeps the tracked state
  assert(ctx.beginScan());
  ctx.abortScan(t0.addSecs(40), true);
  s = ctx.snapshot();
  assert(!s.scanning && s.devices.size() == 1 && s.nextScan == t0.addSecs(70));

  // seeding only replaces previous
  ctx.seedPrevious(devices(5));
  assert(ctx.previous().size() == 5 && ctx.snapshot().devices.size() == 1);

  // readers copy while a writer swaps
  std::atomic<bool> stop{false};
  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      while (!stop.load()) {
        const ScanSnapshot snap = ctx.snapshot();
        assert(snap.devices.size() == 2 || snap.devices.size() == 4 || snap.devices.size() == 1);
      }
    });
  }
  for (int i = 0; i < 2000; ++i) {
    ctx.commitScan(devices(i % 2 ? 2 : 4), t0.addSecs(i), i % 3 == 0);
  }
  stop = true;
  for (auto& t : readers) t.join();

  std::cout << "scanner context test ok\n";
  return 0;
}
