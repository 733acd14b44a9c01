#include "EventStore.hpp"
#include "services/SqlCommon.hpp"
#include "log/log_categories.hpp"
#include <QSqlDatabase>
#include <QSqlDriver>
#include <QSqlError>
#include <QSqlQuery>
#include <QSqlRecord>
#include <QVariant>
#include <QMutexLocker>
#include <QDebug>

static const char* kEventColumns =
    "event_id, person_id, device_id, occurred_at, kind, window_key, "
    "sync_status, attempts, last_error, permanent, updated_at";

static AttendanceEvent rowToEvent(const QSqlQuery& q)
{
    AttendanceEvent e;
    e.eventId      = q.value(0).toString();
    e.personId     = q.value(1).toString();
    e.deviceId     = q.value(2).toString();
    e.occurredAtMs = q.value(3).toLongLong();
    e.kind         = States::eventKindFromString(q.value(4).toString());
    e.window       = q.value(5).toString();
    e.syncStatus   = States::syncStatusFromString(q.value(6).toString());
    e.attempts     = q.value(7).toInt();
    e.lastError    = q.value(8).isNull() ? QString() : q.value(8).toString();
    e.permanent    = q.value(9).toInt() != 0;
    e.updatedAtMs  = q.value(10).toLongLong();
    return e;
}

EventStore::EventStore(const QString& dbPath)
    : dbPath_(dbPath)
{
}

EventStore::~EventStore()
{
    releaseThreadConnection();
}

QSqlDatabase EventStore::connection()
{
    const QString name = SqlCommon::connectionNameForCurrentThread(dbPath_);
    QSqlDatabase db;

    if (!QSqlDatabase::contains(name)) {
        db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
        db.setDatabaseName(dbPath_);
        db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=5000"));
        connNames_ << name;
    } else {
        db = QSqlDatabase::database(name, /*open=*/false);
    }

    if (!db.isOpen()) {
        if (!db.open()) {
            qCCritical(LC_STORE) << "[SQL] DB open failed:" << db.lastError().text()
                                 << " path=" << db.databaseName();
            return db;
        }
        // per-connection durability settings
        QSqlQuery pragma(db);
        pragma.exec(QStringLiteral("PRAGMA synchronous=FULL;"));
        pragma.exec(QStringLiteral("PRAGMA foreign_keys=ON;"));
    }
    return db;
}

void EventStore::releaseThreadConnection()
{
    QMutexLocker locker(&dbMutex);
    const QString name = SqlCommon::connectionNameForCurrentThread(dbPath_);
    if (!connNames_.contains(name)) return;

    {
        QSqlDatabase db = QSqlDatabase::database(name, /*open=*/false);
        if (db.isOpen()) db.close();
    }
    QSqlDatabase::removeDatabase(name);
    connNames_.removeAll(name);
}

void EventStore::setError(const QString& e)
{
    lastError_ = e;
}

QString EventStore::lastError() const
{
    QMutexLocker locker(&dbMutex);
    return lastError_;
}

bool EventStore::exec(QSqlDatabase& db, const QString& sql)
{
    QSqlQuery q(db);
    if (!q.exec(sql)) {
        setError(q.lastError().text());
        qCCritical(LC_STORE) << "[SQL] exec failed:" << q.lastError().text() << "sql=" << sql;
        return false;
    }
    return true;
}

bool EventStore::initializeDatabase()
{
    if (!SqlCommon::ensureParentDir(dbPath_)) {
        QMutexLocker locker(&dbMutex);
        setError(QStringLiteral("cannot create directory for %1").arg(dbPath_));
        qCCritical(LC_STORE) << "[SQL]" << lastError_;
        return false;
    }

    {
        QMutexLocker locker(&dbMutex);
        QSqlDatabase db = connection();
        if (!db.isOpen()) {
            setError(db.lastError().text());
            qCCritical(LC_STORE) << "[SQL] Open failed:" << lastError_ << " path=" << db.databaseName();
            return false;
        }

        {   // journal mode is stored in the file
            QSqlQuery pragma(db);
            pragma.exec(QStringLiteral("PRAGMA journal_mode=WAL;"));
        }

        // attendance queue
        if (!exec(db,
            "CREATE TABLE IF NOT EXISTS attendance_events ("
            "seq         INTEGER PRIMARY KEY AUTOINCREMENT, "
            "event_id    TEXT NOT NULL UNIQUE, "
            "person_id   TEXT NOT NULL, "
            "device_id   TEXT NOT NULL, "
            "occurred_at INTEGER NOT NULL, "
            "kind        TEXT NOT NULL, "
            "window_key  TEXT, "
            "sync_status TEXT NOT NULL DEFAULT 'pending', "
            "attempts    INTEGER NOT NULL DEFAULT 0, "
            "last_error  TEXT, "
            "permanent   INTEGER NOT NULL DEFAULT 0, "
            "updated_at  INTEGER NOT NULL)")) {
            return false;
        }

        // operator log
        if (!exec(db,
            "CREATE TABLE IF NOT EXISTS system_logs ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "level INTEGER NOT NULL, "
            "tag TEXT, "
            "message TEXT NOT NULL, "
            "timestamp TEXT NOT NULL, "
            "extra TEXT)")) {
            return false;
        }

        // indexes
        exec(db, "CREATE INDEX IF NOT EXISTS idx_ev_status   ON attendance_events(sync_status, occurred_at)");
        exec(db, "CREATE INDEX IF NOT EXISTS idx_ev_occurred ON attendance_events(occurred_at)");
        exec(db, "CREATE INDEX IF NOT EXISTS idx_sys_ts      ON system_logs(timestamp)");
        exec(db, "CREATE INDEX IF NOT EXISTS idx_sys_level   ON system_logs(level)");

        qCInfo(LC_STORE) << "[SQL] Database opened & schema ready. path=" << db.databaseName()
                         << " driver=" << db.driverName();
    }

    const int recovered = recoverInFlight();
    if (recovered > 0)
        qCWarning(LC_STORE) << "[SQL] recovered" << recovered << "event(s) left in flight";
    return recovered >= 0;
}

bool EventStore::append(const AttendanceEvent& e)
{
    QMutexLocker locker(&dbMutex);
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        setError(db.lastError().text());
        qCCritical(LC_STORE) << "[append] DB open failed:" << lastError_;
        return false;
    }

    const qint64 now = QDateTime::currentMSecsSinceEpoch();

    QSqlQuery q(db);
    q.prepare("INSERT OR IGNORE INTO attendance_events "
              "(event_id, person_id, device_id, occurred_at, kind, window_key, "
              " sync_status, attempts, last_error, permanent, updated_at) "
              "VALUES (?, ?, ?, ?, ?, ?, 'pending', 0, NULL, 0, ?)");
    q.addBindValue(e.eventId);
    q.addBindValue(e.personId);
    q.addBindValue(e.deviceId);
    q.addBindValue(e.occurredAtMs);
    q.addBindValue(States::toString(e.kind));
    q.addBindValue(e.window);
    q.addBindValue(now);

    if (!q.exec()) {
        setError(q.lastError().text());
        qCCritical(LC_STORE) << "[append] insert failed:" << lastError_ << "event=" << e.eventId;
        return false;
    }
    if (q.numRowsAffected() == 0)
        qCDebug(LC_STORE) << "[append] already stored:" << e.eventId;
    return true;
}

bool EventStore::selectEvents(const QString& where, const QVariantList& binds, QVector<AttendanceEvent>* outRows)
{
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        setError(db.lastError().text());
        return false;
    }

    QSqlQuery q(db);
    q.prepare(QStringLiteral("SELECT %1 FROM attendance_events WHERE %2 ORDER BY occurred_at ASC, seq ASC")
                  .arg(QLatin1String(kEventColumns), where));
    for (const auto& b : binds) q.addBindValue(b);

    if (!q.exec()) {
        setError(q.lastError().text());
        qCCritical(LC_STORE) << "[select] failed:" << lastError_;
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) outRows->push_back(rowToEvent(q));
    }
    return true;
}

bool EventStore::listPending(QVector<AttendanceEvent>* outRows)
{
    QMutexLocker locker(&dbMutex);
    return selectEvents(QStringLiteral("permanent = 0 AND "
                                       "(sync_status = 'pending' OR (sync_status = 'failed' AND attempts < ?))"),
                        { retryCeiling_ }, outRows);
}

bool EventStore::listFailed(QVector<AttendanceEvent>* outRows)
{
    QMutexLocker locker(&dbMutex);
    return selectEvents(QStringLiteral("sync_status = 'failed' AND (permanent = 1 OR attempts >= ?)"),
                        { retryCeiling_ }, outRows);
}

bool EventStore::listSince(qint64 sinceMs, QVector<AttendanceEvent>* outRows)
{
    QMutexLocker locker(&dbMutex);
    return selectEvents(QStringLiteral("occurred_at >= ?"), { sinceMs }, outRows);
}

std::optional<AttendanceEvent> EventStore::find(const QString& eventId)
{
    QMutexLocker locker(&dbMutex);
    QVector<AttendanceEvent> rows;
    if (!selectEvents(QStringLiteral("event_id = ?"), { eventId }, &rows) || rows.isEmpty())
        return std::nullopt;
    return rows.front();
}

bool EventStore::transition(const QString& sql, const QVariantList& binds, const char* what)
{
    QMutexLocker locker(&dbMutex);
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        setError(db.lastError().text());
        qCCritical(LC_STORE) << "[" << what << "] DB open failed:" << lastError_;
        return false;
    }

    QSqlQuery q(db);
    q.prepare(sql);
    for (const auto& b : binds) q.addBindValue(b);

    if (!q.exec()) {
        setError(q.lastError().text());
        qCCritical(LC_STORE) << "[" << what << "] update failed:" << lastError_;
        return false;
    }
    // 0 rows: already in (or past) the target state
    if (q.numRowsAffected() == 0)
        qCDebug(LC_STORE) << "[" << what << "] no-op for" << binds.last().toString();
    return true;
}

bool EventStore::markSyncing(const QString& eventId)
{
    return transition(QStringLiteral(
        "UPDATE attendance_events SET sync_status = 'syncing', attempts = attempts + 1, updated_at = ? "
        "WHERE permanent = 0 AND sync_status IN ('pending', 'failed') AND event_id = ?"),
        { QDateTime::currentMSecsSinceEpoch(), eventId }, "markSyncing");
}

bool EventStore::markSynced(const QString& eventId)
{
    return transition(QStringLiteral(
        "UPDATE attendance_events SET sync_status = 'synced', last_error = NULL, updated_at = ? "
        "WHERE sync_status <> 'synced' AND event_id = ?"),
        { QDateTime::currentMSecsSinceEpoch(), eventId }, "markSynced");
}

bool EventStore::markFailed(const QString& eventId, const QString& error)
{
    return transition(QStringLiteral(
        "UPDATE attendance_events SET sync_status = 'failed', last_error = ?, updated_at = ? "
        "WHERE sync_status IN ('pending', 'syncing') AND event_id = ?"),
        { error, QDateTime::currentMSecsSinceEpoch(), eventId }, "markFailed");
}

bool EventStore::markRejected(const QString& eventId, const QString& reason)
{
    return transition(QStringLiteral(
        "UPDATE attendance_events SET sync_status = 'failed', permanent = 1, last_error = ?, updated_at = ? "
        "WHERE sync_status <> 'synced' AND permanent = 0 AND event_id = ?"),
        { reason, QDateTime::currentMSecsSinceEpoch(), eventId }, "markRejected");
}

int EventStore::countPending()
{
    QMutexLocker locker(&dbMutex);
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        setError(db.lastError().text());
        return -1;
    }

    QSqlQuery q(db);
    q.prepare("SELECT COUNT(*) FROM attendance_events WHERE permanent = 0 AND "
              "(sync_status IN ('pending', 'syncing') OR (sync_status = 'failed' AND attempts < ?))");
    q.addBindValue(retryCeiling_);
    if (!q.exec() || !q.next()) {
        setError(q.lastError().text());
        qCCritical(LC_STORE) << "[countPending] failed:" << lastError_;
        return -1;
    }
    return q.value(0).toInt();
}

int EventStore::purgeSynced(qint64 olderThanMs)
{
    QMutexLocker locker(&dbMutex);
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        setError(db.lastError().text());
        return -1;
    }

    QSqlQuery q(db);
    q.prepare("DELETE FROM attendance_events WHERE sync_status = 'synced' AND updated_at < ?");
    q.addBindValue(olderThanMs);
    if (!q.exec()) {
        setError(q.lastError().text());
        qCCritical(LC_STORE) << "[purgeSynced] failed:" << lastError_;
        return -1;
    }
    return q.numRowsAffected();
}

int EventStore::recoverInFlight()
{
    QMutexLocker locker(&dbMutex);
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        setError(db.lastError().text());
        return -1;
    }

    QSqlQuery q(db);
    q.prepare("UPDATE attendance_events SET sync_status = 'failed', last_error = 'interrupted', updated_at = ? "
              "WHERE sync_status = 'syncing'");
    q.addBindValue(QDateTime::currentMSecsSinceEpoch());
    if (!q.exec()) {
        setError(q.lastError().text());
        qCCritical(LC_STORE) << "[recoverInFlight] failed:" << lastError_;
        return -1;
    }
    return q.numRowsAffected();
}

bool EventStore::insertSystemLog(int level, const QString& tag, const QString& message,
                                 const QDateTime& timestamp, const QString& extra)
{
    QMutexLocker locker(&dbMutex);
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        setError(db.lastError().text());
        return false;
    }

    const QString timeSafe = timestamp.isValid()
                    ? timestamp.toString(Qt::ISODateWithMs)
                    : QDateTime::currentDateTime().toString(Qt::ISODateWithMs);

    QSqlQuery q(db);
    q.prepare("INSERT INTO system_logs (level, tag, message, timestamp, extra) VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(level);
    q.addBindValue(tag.isNull() ? QString("") : tag);
    q.addBindValue(message.isNull() ? QString("") : message);
    q.addBindValue(timeSafe);
    q.addBindValue(extra.isNull() ? QVariant() : QVariant(extra));

    if (!q.exec()) {
        setError(q.lastError().text());
        qCCritical(LC_STORE) << "Insert system log failed:" << lastError_;
        return false;
    }
    return true;
}

bool EventStore::selectSystemLogs(int offset, int limit,
                                  int minLevel, const QString& tagLike, const QString& sinceIso,
                                  QVector<SystemLog>* outRows,
                                  int* outTotal)
{
    QMutexLocker locker(&dbMutex);
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        setError(db.lastError().text());
        return false;
    }

    QString where = QStringLiteral("level >= ?");
    QVariantList binds { minLevel };
    if (!tagLike.isEmpty()) {
        where += QStringLiteral(" AND tag LIKE ?");
        binds << QStringLiteral("%") + tagLike + QStringLiteral("%");
    }
    if (!sinceIso.isEmpty()) {
        where += QStringLiteral(" AND timestamp >= ?");
        binds << sinceIso;
    }

    if (outTotal) {
        QSqlQuery c(db);
        c.prepare(QStringLiteral("SELECT COUNT(*) FROM system_logs WHERE %1").arg(where));
        for (const auto& b : binds) c.addBindValue(b);
        if (!c.exec() || !c.next()) {
            setError(c.lastError().text());
            qCCritical(LC_STORE) << "[selectSystemLogs] count failed:" << lastError_;
            return false;
        }
        *outTotal = c.value(0).toInt();
    }

    QSqlQuery q(db);
    q.prepare(QStringLiteral("SELECT id, level, tag, message, timestamp, extra FROM system_logs "
                             "WHERE %1 ORDER BY id DESC LIMIT ? OFFSET ?").arg(where));
    for (const auto& b : binds) q.addBindValue(b);
    q.addBindValue(qMax(1, limit));
    q.addBindValue(qMax(0, offset));

    if (!q.exec()) {
        setError(q.lastError().text());
        qCCritical(LC_STORE) << "[selectSystemLogs] failed:" << lastError_;
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            SystemLog r;
            r.id        = q.value(0).toInt();
            r.level     = q.value(1).toInt();
            r.tag       = q.value(2).toString();
            r.message   = q.value(3).toString();
            r.timestamp = QDateTime::fromString(q.value(4).toString(), Qt::ISODateWithMs);
            r.extra     = q.value(5).toString();
            outRows->push_back(r);
        }
    }
    return true;
}
