#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QDebug>
#include <exception>
#include "config/ScanConfig.hpp"
#include "presenter/AppPresenter.hpp"
#include "log/SystemLogger.hpp"
#include "logger.hpp"

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName(QStringLiteral("lanwatch"));
				QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));
				QLoggingCategory::setFilterRules(
						"lanwatch.engine.debug=false\n"
						"lanwatch.store.debug=false\n"
						"lanwatch.net.debug=false\n"
				);

				QCommandLineParser parser;
				parser.setApplicationDescription("LAN presence tracker: scans the local segment and streams device state.");
				addScanOptions(parser);

				ScanConfig cfg;
				QString why;
				switch (parseScanCommandLine(parser, app.arguments(), &cfg, &why)) {
					case CliResult::HelpRequested:		parser.showHelp(0);
					case CliResult::VersionRequested:	parser.showVersion();
					case CliResult::Error:
						qCritical().noquote() << "[main]" << why;
						return 2;
					case CliResult::Ok:
						break;
				}

				if (!cfg.logRules.isEmpty()) {
					QString rules = cfg.logRules;
					QLoggingCategory::setFilterRules(rules.replace(QLatin1Char(';'), QLatin1Char('\n')));
				}
				if (!cfg.logFile.isEmpty()) {
					Logger::setFile(cfg.logFile);
					if (Logger::write("lanwatch " + QCoreApplication::applicationVersion().toStdString() + " starting"))
						Logger::installMessageMirror();
					else
						LOG_WARN(QStringLiteral("log file %1 not writable, mirror disabled").arg(cfg.logFile));
				}

				AppPresenter presenter(cfg);

				if (!presenter.startAllServices(&why)) {
						LOG_CRITICAL(QStringLiteral("startup failed: %1").arg(why));
						SystemLogger::shutdown();
						return -1;
				}

				QObject::connect(&app, &QCoreApplication::aboutToQuit, [&presenter]{
						SystemLogger::info("APP", "aboutToQuit");
						presenter.stopAllServices();
						SystemLogger::shutdown();
				});

				return app.exec();
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		}

		return -1;
}
