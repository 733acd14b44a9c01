#pragma once
#include <optional>
#include <QDateTime>
#include <QVector>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QMutex>

#include "include/common_path.hpp"
#include "include/LogDtos.hpp"
#include "include/types.hpp"

class QSqlDatabase;

// Durable attendance queue on SQLite (QSQLITE).
// Safe to use from several threads: each thread gets its own connection and
// every call is serialized on dbMutex.
class EventStore {
public:
    explicit EventStore(const QString& dbPath = QStringLiteral(KIOSK_DB));
    ~EventStore();

    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

    bool initializeDatabase();

    // Drop the calling thread's connection. Worker threads call this before they finish.
    void releaseThreadConnection();

    // Events with attempts >= ceiling are no longer listed as pending
    void setRetryCeiling(int maxAttempts) { retryCeiling_ = maxAttempts; }
    int retryCeiling() const { return retryCeiling_; }

    // false only on local I/O failure; appending an existing eventId is a no-op
    bool append(const AttendanceEvent& e);

    // Pending, or Failed (not permanent) below the retry ceiling; oldest occurredAt first
    bool listPending(QVector<AttendanceEvent>* outRows);

    // Idempotent status transitions. Return false only on I/O failure.
    bool markSyncing(const QString& eventId);
    bool markSynced(const QString& eventId);
    bool markFailed(const QString& eventId, const QString& error);
    bool markRejected(const QString& eventId, const QString& reason);

    std::optional<AttendanceEvent> find(const QString& eventId);

    // Pending + Syncing + retryable Failed; -1 on error
    int countPending();

    // Rejected or retry-exhausted events, kept for manual inspection
    bool listFailed(QVector<AttendanceEvent>* outRows);

    bool listSince(qint64 sinceMs, QVector<AttendanceEvent>* outRows);

    // Delete Synced events last updated before olderThanMs; returns rows removed or -1
    int purgeSynced(qint64 olderThanMs);

    // Events left in Syncing by a crash become Failed("interrupted"); returns count or -1
    int recoverInFlight();

    // Operator log
    bool insertSystemLog(int level, const QString& tag, const QString& message,
                         const QDateTime& timestamp, const QString& extra = QString());

    bool selectSystemLogs(int offset, int limit,
                          int minLevel, const QString& tagLike, const QString& sinceIso,
                          QVector<SystemLog>* outRows,
                          int* outTotal);

    const QString& path() const { return dbPath_; }
    QString lastError() const;

private:
    QSqlDatabase connection();
    bool exec(QSqlDatabase& db, const QString& sql);
    bool transition(const QString& sql, const QVariantList& binds, const char* what);
    bool selectEvents(const QString& where, const QVariantList& binds, QVector<AttendanceEvent>* outRows);
    void setError(const QString& e);

    QString dbPath_;
    int retryCeiling_ = 10;

    mutable QMutex dbMutex;
    QString lastError_;
    QStringList connNames_;
};
