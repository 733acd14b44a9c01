#pragma once
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <QThread>

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("attendance"); }

    inline bool ensureParentDir(const QString& dbPath)
    {
        const QString dir = QFileInfo(dbPath).absolutePath();
        return QDir().mkpath(dir);
    }

    // One connection per (database file, thread); QSqlDatabase handles are not shareable across threads
    inline QString connectionNameForCurrentThread(const QString& dbPath)
    {
        return QString("%1_%2_%3").arg(baseConnName())
                                  .arg(qHash(QFileInfo(dbPath).absoluteFilePath()))
							      .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(QThread::currentThreadId())));
    }
} // namespace SqlCommon
