#include "config/ScanConfig.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFile>
#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

#include "include/scan_params.hpp"

namespace {

bool readInt(const QString& text, const char* name, int minValue, int maxValue, int* out, QString* error)
{
	bool ok = false;
	const int v = text.toInt(&ok);
	if (!ok || v < minValue || v > maxValue) {
		if (error) *error = QStringLiteral("invalid %1: '%2' (expected %3..%4)")
								.arg(QLatin1String(name), text).arg(minValue).arg(maxValue);
		return false;
	}
	*out = v;
	return true;
}

bool readRate(const QJsonObject& o, const char* key, double* out, QString* error)
{
	const QJsonValue v = o.value(QLatin1String(key));
	if (v.isUndefined()) return true;
	const double d = v.toDouble(-1.0);
	if (!v.isDouble() || d < 0.0 || d > 1.0) {
		if (error) *error = QStringLiteral("policy.%1 must be a number in 0..1").arg(QLatin1String(key));
		return false;
	}
	*out = d;
	return true;
}

bool readCount(const QJsonObject& o, const char* key, int* out, QString* error)
{
	const QJsonValue v = o.value(QLatin1String(key));
	if (v.isUndefined()) return true;
	const int n = v.toInt(-1);
	if (!v.isDouble() || n < 0) {
		if (error) *error = QStringLiteral("%1 must be a non-negative integer").arg(QLatin1String(key));
		return false;
	}
	*out = n;
	return true;
}

} // namespace

bool ScanConfig::validate(QString* error) const
{
	auto fail = [&](const QString& why) { if (error) *error = why; return false; };

	if (dbPath.isEmpty())							return fail(QStringLiteral("database path is empty"));
	if (scanIntervalSec < 1)						return fail(QStringLiteral("scan interval must be at least 1 second"));
	if (scanIntervalSec > scan::SCAN_INTERVAL_MAX_SEC)
		return fail(QStringLiteral("scan interval must not exceed %1 seconds").arg(scan::SCAN_INTERVAL_MAX_SEC));
	if (graceScans < 1)								return fail(QStringLiteral("grace scans must be at least 1"));
	if (QHostAddress(listenAddress).isNull())		return fail(QStringLiteral("invalid listen address: %1").arg(listenAddress));
	if (arpTablePath.isEmpty())						return fail(QStringLiteral("ARP table path is empty"));
	if (probeTimeoutMs < 1 || probeWorkers < 1)		return fail(QStringLiteral("port probe settings must be positive"));
	if (policy.occasionalRate > policy.regularRate)	return fail(QStringLiteral("occasional_rate must not exceed regular_rate"));
	return true;
}

bool ScanConfig::applyJson(const QJsonObject& o, ScanConfig* cfg, QString* error)
{
	if (!cfg) return false;
	ScanConfig c = *cfg;

	if (o.contains("db"))			c.dbPath        = o.value("db").toString(c.dbPath);
	if (o.contains("listen"))		c.listenAddress = o.value("listen").toString(c.listenAddress);
	if (o.contains("arp_table"))	c.arpTablePath  = o.value("arp_table").toString(c.arpTablePath);
	if (o.contains("resolve_names")) c.resolveNames = o.value("resolve_names").toBool(c.resolveNames);
	if (o.contains("log_file"))		c.logFile       = o.value("log_file").toString();
	if (o.contains("log_rules"))	c.logRules      = o.value("log_rules").toString();

	int port = c.listenPort;
	if (!readCount(o, "interval", &c.scanIntervalSec, error)
		|| !readCount(o, "grace", &c.graceScans, error)
		|| !readCount(o, "port", &port, error)
		|| !readCount(o, "probe_timeout_ms", &c.probeTimeoutMs, error)
		|| !readCount(o, "probe_workers", &c.probeWorkers, error)) {
		return false;
	}
	if (port < 1 || port > 65535) {
		if (error) *error = QStringLiteral("port out of range: %1").arg(port);
		return false;
	}
	c.listenPort = static_cast<quint16>(port);

	const QJsonObject p = o.value("policy").toObject();
	if (!readCount(p, "new_device_max_scans", &c.policy.newDeviceMaxScans, error)
		|| !readCount(p, "streak_min_scans", &c.policy.streakMinScans, error)
		|| !readCount(p, "streak_min_total", &c.policy.streakMinTotal, error)
		|| !readRate(p, "streak_min_rate", &c.policy.streakMinRate, error)
		|| !readRate(p, "regular_rate", &c.policy.regularRate, error)
		|| !readRate(p, "occasional_rate", &c.policy.occasionalRate, error)) {
		return false;
	}

	*cfg = c;
	return true;
}

bool ScanConfig::loadFromFile(const QString& path, ScanConfig* cfg, QString* error)
{
	QFile f(path);
	if (!f.open(QIODevice::ReadOnly)) {
		if (error) *error = QStringLiteral("open failed: %1: %2").arg(path, f.errorString());
		return false;
	}

	QJsonParseError pe;
	const QJsonDocument jd = QJsonDocument::fromJson(f.readAll(), &pe);
	f.close();
	if (pe.error != QJsonParseError::NoError || !jd.isObject()) {
		if (error) *error = QStringLiteral("%1: not a JSON object (%2)").arg(path, pe.errorString());
		return false;
	}
	return applyJson(jd.object(), cfg, error);
}

void addScanOptions(QCommandLineParser& parser)
{
	parser.addHelpOption();
	parser.addVersionOption();
	parser.addOptions({
		{ "config",     "JSON settings file, applied before the other options.", "file" },
		{ "db",         "SQLite database path.", "path" },
		{ "interval",   "Seconds between scheduled scans.", "seconds" },
		{ "grace",      "Missed scans tolerated before a device is offline.", "count" },
		{ "listen",     "Subscriber server listen address.", "address" },
		{ "port",       "Subscriber server port.", "port" },
		{ "arp-table",  "Kernel ARP table to read.", "path" },
		{ "no-resolve", "Skip reverse name lookup of discovered hosts." },
		{ "log-file",   "Mirror log output into this file.", "path" },
		{ "log-rules",  "Logging filter rules, e.g. \"lanwatch.engine.debug=true\".", "rules" },
	});
}

CliResult parseScanCommandLine(QCommandLineParser& parser, const QStringList& args,
							   ScanConfig* cfg, QString* error)
{
	if (!parser.parse(args)) {
		if (error) *error = parser.errorText();
		return CliResult::Error;
	}
	if (parser.isSet("help"))		return CliResult::HelpRequested;
	if (parser.isSet("version"))	return CliResult::VersionRequested;

	ScanConfig c = *cfg;

	if (parser.isSet("config") && !ScanConfig::loadFromFile(parser.value("config"), &c, error))
		return CliResult::Error;

	if (parser.isSet("db"))			c.dbPath        = parser.value("db");
	if (parser.isSet("listen"))		c.listenAddress = parser.value("listen");
	if (parser.isSet("arp-table"))	c.arpTablePath  = parser.value("arp-table");
	if (parser.isSet("no-resolve"))	c.resolveNames  = false;
	if (parser.isSet("log-file"))	c.logFile       = parser.value("log-file");
	if (parser.isSet("log-rules"))	c.logRules      = parser.value("log-rules");

	if (parser.isSet("interval")
		&& !readInt(parser.value("interval"), "interval", 1, scan::SCAN_INTERVAL_MAX_SEC, &c.scanIntervalSec, error))
		return CliResult::Error;
	if (parser.isSet("grace")
		&& !readInt(parser.value("grace"), "grace", 1, 1000, &c.graceScans, error))
		return CliResult::Error;
	if (parser.isSet("port")) {
		int port = 0;
		if (!readInt(parser.value("port"), "port", 1, 65535, &port, error)) return CliResult::Error;
		c.listenPort = static_cast<quint16>(port);
	}

	if (!c.validate(error)) return CliResult::Error;

	*cfg = c;
	return CliResult::Ok;
}
