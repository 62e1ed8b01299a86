// logger.hpp
#pragma once
#include <string>
#include <QString>
#include <QDebug>
#include <QtGlobal>

#include "include/common_path.hpp"

// Appends timestamped lines to a plain text file (LOG_FILE by default)
class Logger {
public:
    static void setFile(const QString& path);
    static QString file();

    static bool write(const std::string& message);

    // Mirrors every qDebug/qInfo/... line into the file, after the default handler
    static void installMessageMirror();
};

namespace GlobalLogger {

inline void logMessage(QtMsgType type, const QString& functionName, const QString& message)
{
		QString fullMsg = QString("[%1] %2").arg(functionName, message);

		switch (type) {
			case QtDebugMsg:
					qDebug().noquote() << fullMsg;
					break;
			case QtInfoMsg:
					qInfo().noquote() << fullMsg;
					break;
			case QtWarningMsg:
					qWarning().noquote() << fullMsg;
					break;
			case QtCriticalMsg:
					qCritical().noquote() << fullMsg;
					break;
			case QtFatalMsg:
					qFatal("%s", fullMsg.toUtf8().constData());
					break;
		}
}

}		// namespace GlobalLogger

#define LOG_DEBUG(msg)		GlobalLogger::logMessage(QtDebugMsg, __FUNCTION__, msg)
#define LOG_INFO(msg)			GlobalLogger::logMessage(QtInfoMsg, __FUNCTION__, msg)
#define LOG_WARN(msg)			GlobalLogger::logMessage(QtWarningMsg, __FUNCTION__, msg)
#define LOG_CRITICAL(msg) GlobalLogger::logMessage(QtCriticalMsg, __FUNCTION__, msg)
