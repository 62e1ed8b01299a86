#include "engine/ReconciliationEngine.hpp"
#include "services/QSqliteService.hpp"

#include <QCoreApplication>
#include <QTemporaryDir>

#include <cassert>
#include <iostream>

namespace {

QDateTime g_now = QDateTime::fromString("2025-05-01T08:00:00.000Z", Qt::ISODateWithMs);

QDateTime tick() {
  g_now = g_now.addSecs(30);
  return g_now;
}

DiscoveredDevice seen(const QString& address) {
  DiscoveredDevice d;
  d.address = address;
  d.hardwareId = "02:00:00:00:00:" + address.section('.', 3).rightJustified(2, '0');
  d.label = "host-" + address.section('.', 3);
  return d;
}

// Drives the store directly: 'o' online, '-' offline, one cycle per character
void buildHistory(QSqliteService& db, const QString& address, const char* pattern) {
  for (const char* p = pattern; *p; ++p) {
    [[maybe_unused]] bool ok = db.bumpTotalScansForAllKnownDevices();
    assert(ok);
    ok = *p == 'o' ? db.recordOnlineObservation(address, "02:00:00:00:00:aa", "built", tick())
                   : db.recordOfflineObservation(address, "02:00:00:00:00:aa", "built", tick());
    assert(ok);
  }
}

TrackedDevice trackedFor(QSqliteService& db, const ReconciliationEngine& engine, const QString& address) {
  std::optional<Device> d;
  [[maybe_unused]] const bool ok = db.getDevice(address, &d);
  assert(ok && d);
  return engine.trackedFromHistory({*d}).front();
}

const TrackedDevice* find(const ReconcileResult& r, const QString& address) {
  for (const TrackedDevice& t : r.devices) {
    if (t.device.address == address) return &t;
  }
  return nullptr;
}

int logTotal(QSqliteService& db) {
  QVector<CategorizationLogEntry> rows;
  int total = 0;
  [[maybe_unused]] const bool ok = db.selectCategorizationLog(0, 1, &rows, &total);
  assert(ok);
  return total;
}

void assertStoreInvariant(QSqliteService& db) {
  QVector<Device> all;
  [[maybe_unused]] const bool ok = db.getAllDevices(&all);
  assert(ok);
  for (const Device& d : all) {
    assert(d.scansSeenOnline + d.scansSeenOffline == d.totalScans);
    assert(d.consecutiveOnline == 0 || d.consecutiveOffline == 0);
  }
}

// Fails every online observation after the first `allowed` ones
class FailingStore : public QSqliteService {
 public:
  FailingStore(const QString& path, int allowed) : QSqliteService(path), allowed_(allowed) {}

  bool recordOnlineObservation(const QString& address, const QString& hardwareId, const QString& label,
                               const QDateTime& now) override {
    if (allowed_-- <= 0) {
      failed_ = true;
      return false;
    }
    return QSqliteService::recordOnlineObservation(address, hardwareId, label, now);
  }

  QString lastError() const override {
    return failed_ ? QStringLiteral("disk I/O error") : QSqliteService::lastError();
  }

 private:
  int allowed_;
  bool failed_ = false;
};

void testFreshDevice(const QString& dir) {
  QSqliteService db(dir + "/fresh.db");
  assert(db.initializeDatabase());
  ReconciliationEngine engine(&db);

  ReconcileResult r;
  QString why;
  assert(engine.reconcile({seen("10.0.0.5")}, {}, 1, tick(), &r, &why));
  assert(r.devices.size() == 1);
  assert(r.onlineCount == 1 && r.newCount == 1 && r.offlineCount == 0);

  const TrackedDevice& t = r.devices.front();
  assert(t.deviceStatus == DeviceStatus::New);
  assert(t.device.category == DeviceCategory::New);
  assert(t.device.status == "online");
  assert(t.device.totalScans == 1);
  assert(t.device.appearanceRate == 1.0);
  assert(t.missedScans == 0);
  assert(logTotal(db) == 1);
}

void testRegularByRate(const QString& dir) {
  QSqliteService db(dir + "/regular.db");
  assert(db.initializeDatabase());
  ReconciliationEngine engine(&db);

  // 9 cycles, 7 online, currently on a 1-scan streak
  buildHistory(db, "10.0.0.7", "oooooo--o");
  const TrackedDevice prev = trackedFor(db, engine, "10.0.0.7");

  ReconcileResult r;
  assert(engine.reconcile({seen("10.0.0.7")}, {prev}, 2, tick(), &r));
  const TrackedDevice* t = find(r, "10.0.0.7");
  assert(t);
  assert(t->device.totalScans == 10 && t->device.scansSeenOnline == 8);
  assert(t->device.category == DeviceCategory::Regular);
  assert(t->device.reason == "regular device (80% appearance)");
  assert(t->deviceStatus == DeviceStatus::Existing);
  assert(r.newCount == 0);
}

void testGraceThenOffline(const QString& dir) {
  QSqliteService db(dir + "/grace.db");
  assert(db.initializeDatabase());
  ReconciliationEngine engine(&db, CategorizationPolicy(), 3);

  buildHistory(db, "10.0.0.8", "oo-----");
  // tracked as a device currently inside the window
  TrackedDevice start = trackedFor(db, engine, "10.0.0.8");
  start.missedScans = 0;
  start.deviceStatus = DeviceStatus::Existing;
  start.device.category = DeviceCategory::Rare;
  start.device.reason = "rare device (29% appearance)";

  const int logBefore = logTotal(db);
  QVector<TrackedDevice> previous{start};
  ReconcileResult r;

  // missed 1 and 2: kept as existing, category carried, nothing logged
  for (int missed = 1; missed <= 2; ++missed) {
    assert(engine.reconcile({}, previous, 10 + missed, tick(), &r));
    assert(r.devices.size() == 1 && r.offlineCount == 0 && r.onlineCount == 0);
    const TrackedDevice& t = r.devices.front();
    assert(t.deviceStatus == DeviceStatus::Existing);
    assert(t.missedScans == missed);
    assert(t.device.category == DeviceCategory::Rare);
    assert(t.device.reason == "rare device (29% appearance)");
    assert(t.device.totalScans == 7 + missed);
    assert(logTotal(db) == logBefore);
    previous = r.devices;
  }

  // third consecutive miss reaches the grace threshold
  assert(engine.reconcile({}, previous, 13, tick(), &r));
  assert(r.offlineCount == 1);
  const TrackedDevice& off = r.devices.front();
  assert(off.deviceStatus == DeviceStatus::Offline);
  assert(off.missedScans == 3);
  assert(off.device.status == "offline");
  assert(off.device.totalScans == 10 && off.device.scansSeenOnline == 2);
  assert(off.device.category == DeviceCategory::Offline);
  assert(off.device.reason == "offline (historically 20% appearance)");

  QVector<CategorizationLogEntry> log;
  int total = 0;
  assert(db.selectCategorizationLog(0, 1, &log, &total));
  assert(total == logBefore + 1);
  assert(log.front().reason == "missed 3 scans: offline (historically 20% appearance)");
  assert(log.front().scanId == 13 && !log.front().online);
  assert(log.front().category == DeviceCategory::Offline);

  // stays tracked and keeps receiving offline observations
  previous = r.devices;
  assert(engine.reconcile({}, previous, 14, tick(), &r));
  assert(r.devices.front().missedScans == 4 && r.devices.front().device.totalScans == 11);
  assertStoreInvariant(db);
}

void testFlapping(const QString& dir) {
  QSqliteService db(dir + "/flap.db");
  assert(db.initializeDatabase());
  ReconciliationEngine engine(&db);

  QVector<TrackedDevice> previous;
  ReconcileResult r;
  const QString addr = "10.0.0.9";

  const bool presence[] = {true, true, true, true, false, false, true};
  for (bool here : presence) {
    QVector<DiscoveredDevice> current;
    if (here) current.push_back(seen(addr));
    assert(engine.reconcile(current, previous, 1, tick(), &r));
    const TrackedDevice* t = find(r, addr);
    assert(t);
    assert(t->deviceStatus != DeviceStatus::Offline);
    previous = r.devices;
  }

  const TrackedDevice* back = find(r, addr);
  assert(back->deviceStatus == DeviceStatus::Existing);
  assert(back->missedScans == 0);
  std::optional<Device> h;
  assert(db.getDevice(addr, &h) && h);
  assert(h->consecutiveOffline == 0 && h->consecutiveOnline == 1);
  assert(h->totalScans == 7 && h->scansSeenOnline == 5 && h->scansSeenOffline == 2);
}

void testRepeatedCyclesAndInvariant(const QString& dir) {
  QSqliteService db(dir + "/repeat.db");
  assert(db.initializeDatabase());
  ReconciliationEngine engine(&db);

  const QVector<DiscoveredDevice> set{seen("10.0.1.1"), seen("10.0.1.2"), seen("10.0.1.1")};
  QVector<TrackedDevice> previous;
  ReconcileResult r;

  constexpr int kCycles = 6;
  for (int i = 0; i < kCycles; ++i) {
    assert(engine.reconcile(set, previous, i + 1, tick(), &r));
    // duplicate addresses collapse, first wins
    assert(r.devices.size() == 2 && r.onlineCount == 2);
    assert(r.newCount == (i == 0 ? 2 : 0));
    previous = r.devices;
    assertStoreInvariant(db);
  }
  for (const TrackedDevice& t : r.devices) {
    assert(t.device.totalScans == kCycles);
    assert(t.device.scansSeenOnline == kCycles);
    assert(t.device.category == DeviceCategory::Regular);
  }
  assert(r.devices[0].device.label == "host-1");

  // a third device appears and one disappears
  assert(engine.reconcile({seen("10.0.1.1"), seen("10.0.1.3")}, previous, 7, tick(), &r));
  assert(r.devices.size() == 3 && r.newCount == 1 && r.offlineCount == 0);
  assert(find(r, "10.0.1.2")->missedScans == 1);
  assertStoreInvariant(db);
}

void testStoreFailureAbortsCycle(const QString& dir) {
  FailingStore db(dir + "/failing.db", 1);
  assert(db.initializeDatabase());
  ReconciliationEngine engine(&db);

  ReconcileResult untouched;
  untouched.onlineCount = 42;
  QString why;
  assert(!engine.reconcile({seen("10.0.2.1"), seen("10.0.2.2")}, {}, 1, tick(), &untouched, &why));
  assert(why == "disk I/O error");
  assert(untouched.onlineCount == 42 && untouched.devices.isEmpty());

  // the write made before the failure stays committed
  std::optional<Device> first, second;
  assert(db.getDevice("10.0.2.1", &first) && first);
  assert(db.getDevice("10.0.2.2", &second) && !second);
}

void testSeedFromHistory(const QString& dir) {
  QSqliteService db(dir + "/seed.db");
  assert(db.initializeDatabase());
  ReconciliationEngine engine(&db, CategorizationPolicy(), 3);

  buildHistory(db, "10.0.3.1", "oooo");
  buildHistory(db, "10.0.3.2", "---");
  QVector<Device> rows;
  assert(db.getAllDevices(&rows));
  assert(rows.size() == 2);

  const QVector<TrackedDevice> tracked = engine.trackedFromHistory(rows);
  for (const TrackedDevice& t : tracked) {
    if (t.device.address == "10.0.3.1") {
      assert(t.deviceStatus == DeviceStatus::Existing && t.missedScans == 0);
      assert(t.device.status == "online");
    } else {
      assert(t.deviceStatus == DeviceStatus::Offline && t.missedScans == 3);
      assert(t.device.category == DeviceCategory::Offline);
    }
  }

  // a restart does not re-report known devices as new
  ReconcileResult r;
  assert(engine.reconcile({seen("10.0.3.1")}, tracked, 1, tick(), &r));
  assert(r.newCount == 0);
  assert(find(r, "10.0.3.2")->missedScans == 4);
}

}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  QTemporaryDir tmp;
  assert(tmp.isValid());

  testFreshDevice(tmp.path());
  testRegularByRate(tmp.path());
  testGraceThenOffline(tmp.path());
  testFlapping(tmp.path());
  testRepeatedCyclesAndInvariant(tmp.path());
  testStoreFailureAbortsCycle(tmp.path());
  testSeedFromHistory(tmp.path());

  std::cout << "reconciliation engine test ok\n";
  return 0;
}
