#include "config/ScanConfig.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <cassert>
#include <iostream>

namespace {

CliResult parse(const QStringList& args, ScanConfig* cfg, QString* why) {
  QCommandLineParser parser;
  addScanOptions(parser);
  return parseScanCommandLine(parser, QStringList{"lanwatch"} + args, cfg, why);
}

void writeFile(const QString& path, const QByteArray& data) {
  QFile f(path);
  [[maybe_unused]] const bool opened = f.open(QIODevice::WriteOnly);
  assert(opened);
  f.write(data);
}

}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  app.setApplicationVersion("1.0.0");
  QString why;

  // defaults
  ScanConfig defaults;
  assert(defaults.validate(&why));
  assert(defaults.scanIntervalSec == 30 && defaults.graceScans == 3 && defaults.listenPort == 8000);
  assert(defaults.arpTablePath == "/proc/net/arp");

  // JSON overrides, untouched keys keep their value
  ScanConfig cfg;
  QJsonObject o{{"interval", 60},
                {"grace", 5},
                {"port", 9100},
                {"listen", "127.0.0.1"},
                {"resolve_names", false},
                {"policy", QJsonObject{{"regular_rate", 0.8}, {"new_device_max_scans", 5}}}};
  assert(ScanConfig::applyJson(o, &cfg, &why));
  assert(cfg.scanIntervalSec == 60 && cfg.graceScans == 5 && cfg.listenPort == 9100);
  assert(cfg.listenAddress == "127.0.0.1" && !cfg.resolveNames);
  assert(cfg.policy.regularRate == 0.8 && cfg.policy.newDeviceMaxScans == 5);
  assert(cfg.policy.occasionalRate == defaults.policy.occasionalRate);
  assert(cfg.dbPath == defaults.dbPath);

  // bad values leave the config alone
  const ScanConfig before = cfg;
  assert(!ScanConfig::applyJson(QJsonObject{{"interval", "soon"}}, &cfg, &why));
  assert(why.contains("interval"));
  assert(!ScanConfig::applyJson(QJsonObject{{"port", 70000}}, &cfg, &why));
  assert(!ScanConfig::applyJson(QJsonObject{{"policy", QJsonObject{{"regular_rate", 1.5}}}}, &cfg, &why));
  assert(cfg.scanIntervalSec == before.scanIntervalSec && cfg.listenPort == before.listenPort);

  // validation
  ScanConfig broken;
  broken.listenAddress = "nowhere";
  assert(!broken.validate(&why) && why.contains("listen address"));
  broken = ScanConfig{};
  broken.policy.occasionalRate = 0.9;
  assert(!broken.validate(&why));
  broken = ScanConfig{};
  broken.scanIntervalSec = 3000000;
  assert(!broken.validate(&why) && why.contains("must not exceed 86400"));
  broken.scanIntervalSec = 86400;
  assert(broken.validate(&why));

  QTemporaryDir tmp;
  assert(tmp.isValid());
  const QString file = tmp.filePath("lanwatch.json");
  writeFile(file, QJsonDocument(QJsonObject{{"interval", 45}, {"db", tmp.filePath("a.db")}}).toJson());

  cfg = ScanConfig{};
  assert(ScanConfig::loadFromFile(file, &cfg, &why));
  assert(cfg.scanIntervalSec == 45 && cfg.dbPath == tmp.filePath("a.db"));

  writeFile(tmp.filePath("bad.json"), "{ interval: ");
  assert(!ScanConfig::loadFromFile(tmp.filePath("bad.json"), &cfg, &why));
  assert(!ScanConfig::loadFromFile(tmp.filePath("missing.json"), &cfg, &why));
  assert(why.contains("open failed"));

  // command line wins over the file
  cfg = ScanConfig{};
  assert(parse({"--config", file, "--interval", "10", "--no-resolve", "--port", "8123"}, &cfg, &why) ==
         CliResult::Ok);
  assert(cfg.scanIntervalSec == 10 && cfg.dbPath == tmp.filePath("a.db"));
  assert(!cfg.resolveNames && cfg.listenPort == 8123);

  cfg = ScanConfig{};
  assert(parse({"--grace", "0"}, &cfg, &why) == CliResult::Error);
  assert(cfg.graceScans == 3);
  assert(parse({"--interval", "abc"}, &cfg, &why) == CliResult::Error);
  assert(parse({"--bogus"}, &cfg, &why) == CliResult::Error);
  assert(parse({"--config", tmp.filePath("missing.json")}, &cfg, &why) == CliResult::Error);

  // an interval the timer cannot hold is refused from the file too
  const QString huge = tmp.filePath("huge.json");
  writeFile(huge, QJsonDocument(QJsonObject{{"interval", 3000000}}).toJson());
  assert(parse({"--config", huge}, &cfg, &why) == CliResult::Error);
  assert(why.contains("scan interval"));
  assert(parse({"--interval", "86401"}, &cfg, &why) == CliResult::Error);
  assert(parse({"--help"}, &cfg, &why) == CliResult::HelpRequested);
  assert(parse({"--version"}, &cfg, &why) == CliResult::VersionRequested);
  assert(parse({}, &cfg, &why) == CliResult::Ok);

  std::cout << "scan config test ok\n";
  return 0;
}
