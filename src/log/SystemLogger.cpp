#include "SystemLogger.hpp"
#include <memory>
#include <QThread>
#include <QDebug>
#include "services/QSqliteService.hpp"
#include "log/SystemLogTypes.hpp"
#include "log/lanwatch_logging.hpp"

namespace syslog_detail{
class SystemLogWriter : public QObject {
    Q_OBJECT
public:
    explicit SystemLogWriter(const QString& dbPath) : dbPath_(dbPath) {}

public slots:
    void append(const SystemLogEntry& e) {
        // 커넥션은 이 스레드에서 처음 쓸 때 열린다
        if (!svc_) svc_ = std::make_unique<QSqliteService>(dbPath_);
        if (!svc_->insertSystemLog(
                static_cast<int>(e.level),
                e.tag,
                e.message,
                e.ts.isValid() ? e.ts : QDateTime::currentDateTimeUtc(),
                e.extra)) {
            qCWarning(LC_STORE).noquote() << "[SystemLogWriter] dropped" << e.tag << e.message;
        }
    }

private:
    QString dbPath_;
    std::unique_ptr<QSqliteService> svc_;
};
} // namespace

SystemLogger& SystemLogger::instance() {
    static SystemLogger inst;
    return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() {}

void SystemLogger::init(const QString& dbPath, SysLogLevel minLevel)
{
	auto& inst = instance();
	if (inst.th) return;

    qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	inst.minLevel_ = minLevel;
	inst.th = new QThread;
	inst.th->setObjectName(QStringLiteral("syslog"));
	inst.wr = new syslog_detail::SystemLogWriter(dbPath);
	inst.wr->moveToThread(inst.th);

    QObject::connect(&inst, &SystemLogger::appendRequested,
                     inst.wr, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
    QObject::connect(inst.th, &QThread::finished, inst.wr, &QObject::deleteLater);
    inst.th->start();
}

void SystemLogger::shutdown() {
	auto& inst = instance();
 	if (!inst.th) return;

	QObject::disconnect(&inst, &SystemLogger::appendRequested, nullptr, nullptr);

	inst.th->quit();
    if (!inst.th->wait(3000)) {
        qWarning() << "[SystemLogger] writer thread did not stop in time";
        inst.th->terminate();
        inst.th->wait();
    }

    delete inst.th;
    inst.th = nullptr;
	inst.wr = nullptr;
}

bool SystemLogger::isRunning()
{
	return instance().th != nullptr;
}

void SystemLogger::post(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra) {
	auto& inst = instance();
	if (!inst.th || static_cast<int>(lv) < static_cast<int>(inst.minLevel_)) return;

    SystemLogEntry e{lv, tag, msg, QDateTime::currentDateTimeUtc(), extra};
    emit inst.appendRequested(e);
}
void SystemLogger::debug(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Debug, tag, msg, extra); }
void SystemLogger::info (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Info , tag, msg, extra); }
void SystemLogger::warn (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Warn , tag, msg, extra); }
void SystemLogger::error(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Error, tag, msg, extra); }
void SystemLogger::critical(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Critical, tag, msg, extra); }

#include "SystemLogger.moc"
