#pragma once
#include <QObject>
#include <QThread>

#include "SystemLogTypes.hpp"
#include "include/common_path.hpp"

namespace syslog_detail { class SystemLogWriter; }

// Operator-visible log, persisted to the system_logs table on a writer thread.
class SystemLogger final : public QObject {
    Q_OBJECT
public:
    static SystemLogger& instance();
    static void init(const QString& dbPath = QStringLiteral(KIOSK_DB));  // once at startup
    static void shutdown();                                              // flushes queued entries

    static bool isRunning();

    static void debug(const QString& tag, const QString& msg, const QString& extra = {});
    static void info (const QString& tag, const QString& msg, const QString& extra = {});
    static void warn (const QString& tag, const QString& msg, const QString& extra = {});
    static void error(const QString& tag, const QString& msg, const QString& extra = {});
    static void critical(const QString& tag, const QString& msg, const QString& extra = {});

signals:
    void appendRequested(const SystemLogEntry& e);

private:
	QThread* th = nullptr;
	syslog_detail::SystemLogWriter* wr = nullptr;

    explicit SystemLogger(QObject* parent=nullptr);
    ~SystemLogger() override;
};
