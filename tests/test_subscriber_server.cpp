#include "hub/SubscriberServer.hpp"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutex>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>
#include <QThread>

#include <atomic>
#include <cassert>
#include <functional>
#include <iostream>

#include "discovery/PortProbe.hpp"
#include "hub/BroadcastHub.hpp"
#include "services/QSqliteService.hpp"
#include "services/QueryService.hpp"
#include "services/ScannerContext.hpp"

namespace {

bool waitUntil(const std::function<bool()>& done, int timeoutMs = 10000) {
  QElapsedTimer t;
  t.start();
  while (!done()) {
    if (t.elapsed() > timeoutMs) return false;
    QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    QThread::msleep(5);
  }
  return true;
}

// Next JSON line from the server, pumping the server side meanwhile
QJsonObject readJson(QTcpSocket& sock) {
  QElapsedTimer t;
  t.start();
  while (!sock.canReadLine()) {
    assert(t.elapsed() < 10000);
    QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    sock.waitForReadyRead(20);
  }
  const QByteArray line = sock.readLine();
  const QJsonDocument doc = QJsonDocument::fromJson(line);
  assert(doc.isObject());
  return doc.object();
}

void send(QTcpSocket& sock, const QByteArray& line) {
  sock.write(line + '\n');
  sock.flush();
}

void send(QTcpSocket& sock, const QJsonObject& obj) {
  send(sock, QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

// Takes a while and reports nothing open
class SlowProbe : public PortProbe {
 public:
  QVector<PortResult> probe(const QString&, const QVector<int>&) override {
    QThread::msleep(300);
    finished = true;
    return {};
  }
  std::atomic<bool> finished{false};
};

QMutex g_logMutex;
QStringList g_storeWarnings;
QtMessageHandler g_previousHandler = nullptr;

void captureStoreWarnings(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
  if (type == QtWarningMsg && ctx.category && QByteArray(ctx.category) == "lanwatch.store") {
    QMutexLocker lk(&g_logMutex);
    g_storeWarnings.push_back(msg);
  }
  if (g_previousHandler) g_previousHandler(type, ctx, msg);
}

bool storeWarned(const QString& needle) {
  QMutexLocker lk(&g_logMutex);
  for (const QString& w : g_storeWarnings) {
    if (w.contains(needle)) return true;
  }
  return false;
}

// close() joins a port scan that is still running
void testCloseJoinsPortScans(const QString& dir) {
  QSqliteService db(dir + "/close.db");
  assert(db.initializeDatabase());
  ScannerContext ctx(30);
  BroadcastHub hub;
  SlowProbe slow;
  QueryService query(&db, &ctx, &slow);
  SubscriberServer server(&hub, &query);
  assert(server.listen(QHostAddress::LocalHost, 0));

  QTcpSocket client;
  client.connectToHost(QHostAddress::LocalHost, server.serverPort());
  assert(client.waitForConnected(5000));
  assert(readJson(client)["type"].toString() == "initial_state");

  send(client, QJsonObject{{"type", "scan_ports"}, {"address", "127.0.0.1"}, {"ports", QJsonArray{9}}});
  assert(waitUntil([&] { return server.activePortScans() == 1; }));
  assert(!slow.finished.load());

  server.close();
  assert(slow.finished.load());
  assert(server.activePortScans() == 0);
  assert(server.clientCount() == 0);
}

}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  QTemporaryDir tmp;
  assert(tmp.isValid());

  g_previousHandler = qInstallMessageHandler(captureStoreWarnings);

  testCloseJoinsPortScans(tmp.path());

  QSqliteService db(tmp.filePath("server.db"));
  assert(db.initializeDatabase());

  const QDateTime t0 = QDateTime::currentDateTimeUtc();
  assert(db.bumpTotalScansForAllKnownDevices());
  assert(db.recordOnlineObservation("10.3.0.1", "aa:bb:cc:dd:ee:01", "printer", t0));
  qint64 scanId = -1;
  assert(db.appendScanEvent(1, "arp_cache_file", t0, &scanId));
  for (int i = 0; i < 3; ++i) {
    CategorizationLogEntry e;
    e.scanId = scanId;
    e.address = "10.3.0.1";
    e.totalScans = 1;
    e.scansSeenOnline = 1;
    e.appearanceRate = 1.0;
    e.reason = QStringLiteral("new device (seen %1 times)").arg(i + 1);
    e.loggedAt = t0;
    assert(db.appendCategorizationLog(e));
  }

  ScannerContext ctx(30);
  TrackedDevice tracked;
  tracked.device.address = "10.3.0.1";
  tracked.device.hardwareId = "aa:bb:cc:dd:ee:01";
  tracked.device.label = "printer";
  tracked.device.totalScans = 1;
  tracked.device.scansSeenOnline = 1;
  tracked.device.appearanceRate = 1.0;
  assert(ctx.beginScan());
  ctx.commitScan({tracked}, t0, true);

  BroadcastHub hub;
  TcpPortProbe probe(500, 4, 0);
  QueryService query(&db, &ctx, &probe);
  SubscriberServer server(&hub, &query);
  assert(server.listen(QHostAddress::LocalHost, 0));
  assert(server.serverPort() != 0);

  int scanRequests = 0;
  QObject::connect(&hub, &BroadcastHub::scanNowRequested, [&] { ++scanRequests; });

  QTcpSocket client;
  client.connectToHost(QHostAddress::LocalHost, server.serverPort());
  assert(client.waitForConnected(5000));

  // greeting
  QJsonObject msg = readJson(client);
  assert(msg["type"].toString() == "initial_state");
  assert(msg["count"].toInt() == 1);
  assert(msg["scan_interval"].toInt() == 30);
  assert(msg["scanning"].toBool() == false);
  assert(msg["devices"].toArray()[0].toObject()["address"].toString() == "10.3.0.1");
  assert(waitUntil([&] { return server.clientCount() == 1 && hub.subscriberCount() == 1; }));

  send(client, QJsonObject{{"type", "get_devices"}});
  msg = readJson(client);
  assert(msg["type"].toString() == "devices" && msg["success"].toBool());
  assert(msg["count"].toInt() == 1);
  assert(!msg["last_scan"].isNull());

  send(client, QJsonObject{{"type", "update_notes"}, {"address", "10.3.0.1"}, {"notes", "office printer"}});
  msg = readJson(client);
  assert(msg["type"].toString() == "notes_result");
  assert(msg["success"].toBool() && msg["message"].toString() == "Notes updated");
  std::optional<Device> stored;
  assert(db.getDevice("10.3.0.1", &stored) && stored && stored->notes == "office printer");

  send(client, QJsonObject{{"type", "update_notes"}, {"address", "10.3.0.99"}, {"notes", "x"}});
  msg = readJson(client);
  assert(msg["type"].toString() == "notes_result" && !msg["success"].toBool());
  assert(msg["message"].toString().contains("device not found"));
  assert(storeWarned("rejected:"));

  send(client, QJsonObject{{"type", "get_log"}, {"limit", 2}});
  msg = readJson(client);
  assert(msg["type"].toString() == "categorization_log");
  assert(msg["count"].toInt() == 2 && msg["total"].toInt() == 3);
  assert(msg["entries"].toArray()[0].toObject()["reason"].toString() == "new device (seen 3 times)");

  // scan history and system log
  send(client, QJsonObject{{"type", "get_scans"}, {"limit", 5}});
  msg = readJson(client);
  assert(msg["type"].toString() == "scans" && msg["success"].toBool());
  assert(msg["count"].toInt() == 1);
  const QJsonObject scanRow = msg["scans"].toArray()[0].toObject();
  assert(scanRow["id"].toInteger() == scanId);
  assert(scanRow["devices_found"].toInt() == 1 && scanRow["scan_method"].toString() == "arp_cache_file");

  assert(db.insertSystemLog(1, "APP", "started", t0));
  assert(db.insertSystemLog(3, "SCAN", "scan failed: arp table unreadable", t0.addSecs(5)));
  send(client, QJsonObject{{"type", "get_system_logs"}, {"min_level", 2}});
  msg = readJson(client);
  assert(msg["type"].toString() == "system_logs" && msg["success"].toBool());
  assert(msg["count"].toInt() == 1 && msg["total"].toInt() == 1);
  assert(msg["entries"].toArray()[0].toObject()["tag"].toString() == "SCAN");
  assert(msg["entries"].toArray()[0].toObject()["level"].toInt() == 3);

  send(client, QJsonObject{{"type", "get_system_logs"}, {"tag", "APP"}});
  msg = readJson(client);
  assert(msg["total"].toInt() == 1);
  assert(msg["entries"].toArray()[0].toObject()["message"].toString() == "started");

  send(client, QJsonObject{{"type", "get_system_logs"},
                           {"since", t0.addSecs(1).toString(Qt::ISODateWithMs)}});
  msg = readJson(client);
  assert(msg["total"].toInt() == 1);

  send(client, QJsonObject{{"type", "get_system_logs"}, {"since", "yesterday"}});
  msg = readJson(client);
  assert(msg["type"].toString() == "system_logs" && !msg["success"].toBool());
  assert(msg["message"].toString().contains("since"));

  send(client, QJsonObject{{"type", "get_stats"}});
  msg = readJson(client);
  assert(msg["type"].toString() == "stats" && msg["success"].toBool());
  assert(msg["total_devices"].toInt() == 1 && msg["total_scans"].toInt() == 1);
  assert(msg["active_24h"].toInt() == 1);
  const QJsonObject row = msg["devices"].toArray()[0].toObject();
  assert(row["appearance_rate"].toDouble() == 100.0);
  assert(row["notes"].toString() == "office printer");

  // malformed input keeps the connection open
  send(client, QByteArray("{not json"));
  msg = readJson(client);
  assert(msg["type"].toString() == "error");

  send(client, QJsonObject{{"type", "reboot"}});
  msg = readJson(client);
  assert(msg["type"].toString() == "error");
  assert(msg["message"].toString().contains("reboot"));

  send(client, QJsonObject{{"type", "scan_now"}});
  assert(waitUntil([&] { return scanRequests == 1; }));

  // hub events reach the socket
  assert(hub.publish(QJsonObject{{"type", "scan_progress"}, {"message", "hello"}}) == 1);
  msg = readJson(client);
  assert(msg["type"].toString() == "scan_progress" && msg["message"].toString() == "hello");

  // port scan against a local listener
  QTcpServer target;
  assert(target.listen(QHostAddress::LocalHost, 0));
  const int openPort = target.serverPort();
  send(client, QJsonObject{{"type", "scan_ports"}, {"address", "127.0.0.1"},
                           {"ports", QJsonArray{openPort}}});
  msg = readJson(client);
  assert(msg["type"].toString() == "port_scan");
  assert(msg["address"].toString() == "127.0.0.1");
  const QJsonArray ports = msg["ports"].toArray();
  assert(ports.size() == 1 && ports[0].toObject()["port"].toInt() == openPort);
  assert(ports[0].toObject()["status"].toString() == "open");
  assert(msg["appliance"].toObject()["detected"].toBool() == false);
  assert(waitUntil([&] { return server.activePortScans() == 0; }));

  send(client, QJsonObject{{"type", "scan_ports"}, {"address", "not-an-ip"}});
  msg = readJson(client);
  assert(msg["type"].toString() == "error");

  send(client, QJsonObject{{"type", "scan_ports"}, {"address", "127.0.0.1"}, {"ports", QJsonArray{70000}}});
  msg = readJson(client);
  assert(msg["type"].toString() == "error");

  // a request without a newline cannot grow forever
  QTcpSocket flood;
  flood.connectToHost(QHostAddress::LocalHost, server.serverPort());
  assert(flood.waitForConnected(5000));
  assert(readJson(flood)["type"].toString() == "initial_state");
  assert(waitUntil([&] { return server.clientCount() == 2; }));
  flood.write(QByteArray(70 * 1024, 'a'));
  flood.flush();
  assert(waitUntil([&] { return server.clientCount() == 1 && hub.subscriberCount() == 1; }));
  assert(waitUntil([&] {
    flood.waitForReadyRead(10);
    return flood.state() == QAbstractSocket::UnconnectedState;
  }));

  // disconnect unregisters the subscriber
  client.disconnectFromHost();
  assert(waitUntil([&] { return server.clientCount() == 0 && hub.subscriberCount() == 0; }));
  assert(hub.publish(QJsonObject{{"type", "scan_update"}}) == 0);

  server.close();
  std::cout << "subscriber server test ok\n";
  return 0;
}
