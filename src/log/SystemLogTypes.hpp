#pragma once
#include <QString>
#include <QDateTime>
#include <QMetaType>

enum class SysLogLevel { Debug=0, Info=1, Warn=2, Error=3, Critical=4 };

struct SystemLogEntry {
    SysLogLevel level;
    QString tag;        // "SCAN", "STORE", "HUB", "APP"
    QString message;
    QDateTime ts;
    QString extra;
};

// system_logs row
struct SystemLog {
    int id{};
    int level{};        // 0~4
    QString tag;
    QString message;
    QDateTime timestamp;
    QString extra;
};

Q_DECLARE_METATYPE(SystemLogEntry)
