#include "logger.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QDateTime>
#include <cstdarg>   // va_list
#include <cstdio>    // vsnprintf
#include <iostream>

namespace {

struct SinkState {
    QMutex mu;
    QString dir;
    QString filePath;
    qint64 maxBytes = 0;
    int keepFiles = 0;
    bool installed = false;
    QtMessageHandler previous = nullptr;
};

SinkState& sink()
{
    static SinkState s;
    return s;
}

// kiosk.log -> kiosk.log.1 -> ... -> kiosk.log.N (oldest dropped)
void rotateLocked(SinkState& s)
{
    const QString oldest = QStringLiteral("%1.%2").arg(s.filePath).arg(s.keepFiles);
    if (QFile::exists(oldest)) QFile::remove(oldest);

    for (int i = s.keepFiles - 1; i >= 1; --i) {
        const QString from = QStringLiteral("%1.%2").arg(s.filePath).arg(i);
        if (QFile::exists(from))
            QFile::rename(from, QStringLiteral("%1.%2").arg(s.filePath).arg(i + 1));
    }
    if (s.keepFiles > 0)
        QFile::rename(s.filePath, s.filePath + QStringLiteral(".1"));
    else
        QFile::remove(s.filePath);
}

void appendLine(const QString& line)
{
    SinkState& s = sink();
    QMutexLocker lock(&s.mu);
    if (!s.installed) return;

    QFileInfo fi(s.filePath);
    if (fi.exists() && s.maxBytes > 0 && fi.size() >= s.maxBytes) rotateLocked(s);

    QFile f(s.filePath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::cerr << "log file open failed: " << s.filePath.toStdString() << std::endl;
        return;
    }
    f.write(line.toUtf8());
    f.write("\n");
}

void fileHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    appendLine(qFormatLogMessage(type, ctx, msg));

    QtMessageHandler prev = sink().previous;
    if (prev) prev(type, ctx, msg);
    else std::cerr << qPrintable(qFormatLogMessage(type, ctx, msg)) << std::endl;
}

} // namespace

bool Logger::install(const QString& dir, qint64 maxBytes, int keepFiles)
{
    SinkState& s = sink();
    {
        QMutexLocker lock(&s.mu);
        if (s.installed) return true;

        if (!QDir().mkpath(dir)) {
            std::cerr << "log directory create failed: " << dir.toStdString() << std::endl;
            return false;
        }
        s.dir = dir;
        s.filePath = QDir(dir).filePath(QStringLiteral(KIOSK_LOG_FILE));
        s.maxBytes = maxBytes;
        s.keepFiles = keepFiles;
        s.installed = true;
    }
    s.previous = qInstallMessageHandler(fileHandler);
    return true;
}

void Logger::uninstall()
{
    SinkState& s = sink();
    QtMessageHandler prev = nullptr;
    {
        QMutexLocker lock(&s.mu);
        if (!s.installed) return;
        s.installed = false;
        prev = s.previous;
    }
    qInstallMessageHandler(prev);
}

void Logger::write(const std::string& message) {
    const QString ts = QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd hh:mm:ss"));
    appendLine(QStringLiteral("[%1] %2").arg(ts, QString::fromStdString(message)));
}

void Logger::writef(const char* format, ...)
{
		char buffer[1024];

		va_list args;
		va_start(args, format);
		vsnprintf(buffer, sizeof(buffer), format, args);
		va_end(args);

		write(std::string(buffer));
}
