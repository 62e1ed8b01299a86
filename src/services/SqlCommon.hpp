#pragma once
#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <QThread>
#include <QVariant>

#include "include/common_path.hpp"

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("lanwatch"); }

    inline QString defaultDbFilePath()
    {
        return QStringLiteral(DB_PATH DB);
    }

    inline bool ensureParentDir(const QString& dbFile)
    {
        const QString dir = QFileInfo(dbFile).absolutePath();
        return QDir().mkpath(dir);
    }

    // One QSqlDatabase connection per (file, thread) pair
    inline QString connectionNameForCurrentThread(const QString& dbFile)
    {
        const QByteArray fileKey = QCryptographicHash::hash(dbFile.toUtf8(), QCryptographicHash::Md5).toHex().left(8);
        return QString("%1_%2_%3").arg(baseConnName())
                                  .arg(QString::fromLatin1(fileKey))
							      .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(QThread::currentThreadId())));
    }

    inline QString toDbTime(const QDateTime& ts)
    {
        return ts.toUTC().toString(Qt::ISODateWithMs);
    }

    inline QVariant toDbTimeOrNull(const QDateTime& ts)
    {
        return ts.isValid() ? QVariant(toDbTime(ts)) : QVariant();
    }

    inline QDateTime fromDbTime(const QVariant& v)
    {
        if (v.isNull()) return QDateTime();
        QDateTime t = QDateTime::fromString(v.toString(), Qt::ISODateWithMs);
        if (!t.isValid()) t = QDateTime::fromString(v.toString(), Qt::ISODate);
        return t.toUTC();
    }
} // namespace SqlCommon
