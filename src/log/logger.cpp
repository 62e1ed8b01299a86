#include "logger.hpp"
#include <fstream>
#include <iostream>
#include <ctime>
#include <mutex>
#include <sys/stat.h>
#include <unistd.h>
#include <cstring>
#include <errno.h>
#include <QByteArray>
#include <QFileInfo>

namespace {
std::mutex g_fileMutex;
std::string g_filePath = LOG_FILE;
QtMessageHandler g_prevHandler = nullptr;

const char* typeTag(QtMsgType type)
{
	switch (type) {
		case QtDebugMsg:	return "D";
		case QtInfoMsg:		return "I";
		case QtWarningMsg:	return "W";
		case QtCriticalMsg:	return "C";
		case QtFatalMsg:	return "F";
	}
	return "?";
}

void mirrorHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
	if (g_prevHandler) g_prevHandler(type, ctx, msg);

	std::string line = std::string(typeTag(type)) + " ";
	if (ctx.category && std::strcmp(ctx.category, "default") != 0)
		line += std::string(ctx.category) + " ";
	line += msg.toStdString();
	Logger::write(line);
}
} // namespace

void Logger::setFile(const QString& path)
{
	std::lock_guard<std::mutex> lk(g_fileMutex);
	g_filePath = path.toStdString();
}

QString Logger::file()
{
	std::lock_guard<std::mutex> lk(g_fileMutex);
	return QString::fromStdString(g_filePath);
}

bool Logger::write(const std::string& message) {
    std::lock_guard<std::mutex> lk(g_fileMutex);

    const std::string dir = QFileInfo(QString::fromStdString(g_filePath)).absolutePath().toStdString();

    // 디렉토리가 없으면 생성
    if (access(dir.c_str(), F_OK) == -1) {
        if (mkdir(dir.c_str(), 0755) == -1) {
            std::cerr << "log directory create failed: " << dir << ": " << strerror(errno) << std::endl;
            return false;
        }
    }

    // 현재 시간 가져오기
    time_t now = time(0);
    tm ltm{};
    localtime_r(&now, &ltm);

    char timeStr[32];
    strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", &ltm);

    // 로그 파일에 추가 쓰기
    std::ofstream logFile(g_filePath, std::ios::app);
    if (!logFile.is_open()) {
        std::cerr << "log file open failed: " << g_filePath << std::endl;
        return false;
    }
    logFile << "[" << timeStr << "] " << message << std::endl;
    return true;
}

void Logger::installMessageMirror()
{
	if (g_prevHandler) return;
	g_prevHandler = qInstallMessageHandler(mirrorHandler);
}
