#pragma once
#include <QObject>
#include <QThread>

#include "SystemLogTypes.hpp"

namespace syslog_detail { class SystemLogWriter; }

// Tagged records persisted to system_logs from a dedicated thread.
// Calls made before init() are dropped.
class SystemLogger final : public QObject {
    Q_OBJECT
public:
    static SystemLogger& instance();
    static void init(const QString& dbPath, SysLogLevel minLevel = SysLogLevel::Info);   // 앱 시작시 1회
    static void shutdown();

    static bool isRunning();

    static void debug(const QString& tag, const QString& msg, const QString& extra = {});
    static void info (const QString& tag, const QString& msg, const QString& extra = {});
    static void warn (const QString& tag, const QString& msg, const QString& extra = {});
    static void error(const QString& tag, const QString& msg, const QString& extra = {});
    static void critical(const QString& tag, const QString& msg, const QString& extra = {});

signals:
    void appendRequested(const SystemLogEntry& e); // 워커에게 보냄

private:
	static void post(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra);

	QThread* th = nullptr;
	syslog_detail::SystemLogWriter* wr = nullptr;
	SysLogLevel minLevel_ = SysLogLevel::Info;

    explicit SystemLogger(QObject* parent=nullptr);
    ~SystemLogger() override;
};
