#pragma once
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "include/common_path.hpp"
#include "policy/CategorizationPolicy.hpp"

class QCommandLineParser;

// Runtime settings: compile-time defaults, then an optional JSON file,
// then command line options
struct ScanConfig {
	QString		dbPath         = QStringLiteral(DB_PATH DB);
	int			scanIntervalSec = SCAN_INTERVAL_SEC;
	int			graceScans     = GRACE_SCANS;
	QString		listenAddress  = QStringLiteral(LISTEN_ADDRESS);
	quint16		listenPort     = LISTEN_PORT;
	QString		arpTablePath   = QStringLiteral(ARP_TABLE_PATH);
	bool		resolveNames   = true;
	QString		logFile;				// empty: no file mirror
	QString		logRules;				// QLoggingCategory filter rules, ';' separated
	int			probeTimeoutMs = 2000;
	int			probeWorkers   = 20;
	CategorizationParams policy;

	bool validate(QString* error) const;

	static bool applyJson(const QJsonObject& o, ScanConfig* cfg, QString* error);
	static bool loadFromFile(const QString& path, ScanConfig* cfg, QString* error);
};

enum class CliResult { Ok, Error, HelpRequested, VersionRequested };

// Registers help, version and the lanwatch options on the parser
void addScanOptions(QCommandLineParser& parser);

// --config is read first, every other option overrides it
CliResult parseScanCommandLine(QCommandLineParser& parser, const QStringList& args,
							   ScanConfig* cfg, QString* error);
