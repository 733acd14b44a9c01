#include "SystemLogger.hpp"
#include <QThread>
#include <QDebug>
#include <memory>
#include "services/EventStore.hpp"
#include "log/SystemLogTypes.hpp"
#include "log/log_categories.hpp"

namespace syslog_detail{
class SystemLogWriter : public QObject {
    Q_OBJECT
public:
    explicit SystemLogWriter(const QString& dbPath) : dbPath_(dbPath) {}

public slots:
    void append(const SystemLogEntry& e) {
        if (!store_) {
            store_ = std::make_unique<EventStore>(dbPath_);
            if (!store_->initializeDatabase()) {
                qCWarning(LC_STORE) << "[SystemLogWriter] store unavailable:" << store_->lastError();
            }
        }
        if (!store_->insertSystemLog(static_cast<int>(e.level), e.tag, e.message,
                                     e.ts.isValid() ? e.ts : QDateTime::currentDateTime(),
                                     e.extra)) {
            qCWarning(LC_STORE) << "[SystemLogWriter] dropped" << e.tag << e.message;
        }
    }

    // runs on the writer thread
    void close() {
        if (store_) {
            store_->releaseThreadConnection();
            store_.reset();
        }
    }

private:
    QString dbPath_;
    std::unique_ptr<EventStore> store_;
};
} // namespace

SystemLogger& SystemLogger::instance() {
    static SystemLogger inst;
    return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() {}

void SystemLogger::init(const QString& dbPath)
{
	auto& inst = instance();
	if (inst.th) return;

    qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	inst.th = new QThread;
	inst.th->setObjectName(QStringLiteral("syslog"));
	inst.wr = new syslog_detail::SystemLogWriter(dbPath);
	inst.wr->moveToThread(inst.th);

    QObject::connect(&inst, &SystemLogger::appendRequested,
                     inst.wr, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
    QObject::connect(inst.th, &QThread::finished, inst.wr, &QObject::deleteLater);
    inst.th->start();
}

bool SystemLogger::isRunning()
{
	return instance().th != nullptr;
}

void SystemLogger::shutdown() {
	auto& inst = instance();
 	if (!inst.th) return;

	// queued appends run before this, then the connection is dropped on its own thread
	QMetaObject::invokeMethod(inst.wr, [w = inst.wr] { w->close(); }, Qt::BlockingQueuedConnection);

	QObject::disconnect(&inst, &SystemLogger::appendRequested, nullptr, nullptr);
	inst.th->quit();
    if (!inst.th->wait(3000)) {
        qCWarning(LC_STORE) << "[SystemLogger] writer thread did not stop in time";
        inst.th->terminate();
        inst.th->wait();
    }

    delete inst.th;
    inst.th = nullptr;
	inst.wr = nullptr;
}

static void post(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra) {
    if (!SystemLogger::isRunning()) return;
    SystemLogEntry e{lv, tag, msg, QDateTime::currentDateTime(), extra};
    emit SystemLogger::instance().appendRequested(e);
}
void SystemLogger::debug(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Debug, tag, msg, extra); }
void SystemLogger::info (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Info , tag, msg, extra); }
void SystemLogger::warn (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Warn , tag, msg, extra); }
void SystemLogger::error(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Error, tag, msg, extra); }
void SystemLogger::critical(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Critical, tag, msg, extra); }

#include "SystemLogger.moc"
