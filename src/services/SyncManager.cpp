#include "services/SyncManager.hpp"
#include "services/EventStore.hpp"
#include "log/log_categories.hpp"
#include "log/SystemLogger.hpp"

#include <QDateTime>
#include <QTimer>
#include <QVector>
#include <QDebug>

static constexpr qint64 kPurgeEveryMs = 60LL * 60 * 1000;
static constexpr qint64 kDayMs = 24LL * 60 * 60 * 1000;

SyncManager::SyncManager(EventStore* store, std::unique_ptr<IBackendClient> client, const SyncParams& params,
                         QObject* parent)
	: QObject(parent)
	, store_(store)
	, client_(std::move(client))
	, params_(params)
	, backoff_(params.backoffBaseMs, params.backoffCapMs)
	, clock_([] { return QDateTime::currentMSecsSinceEpoch(); })
{
	if (store_) store_->setRetryCeiling(params_.maxAttempts);
}

SyncManager::~SyncManager() = default;

void SyncManager::start()
{
	stopping_ = false;
	if (!intervalTimer_) {
		intervalTimer_ = new QTimer(this);
		connect(intervalTimer_, &QTimer::timeout, this, &SyncManager::triggerSync);

		retryTimer_ = new QTimer(this);
		retryTimer_->setSingleShot(true);
		connect(retryTimer_, &QTimer::timeout, this, &SyncManager::triggerSync);
	}
	intervalTimer_->start(params_.syncIntervalMs);
	qCInfo(LC_SYNC) << "[SyncManager] started, interval" << params_.syncIntervalMs << "ms, maxAttempts"
	                << params_.maxAttempts;
	publishStatus();
}

void SyncManager::stop()
{
	requestStop();
	if (intervalTimer_) intervalTimer_->stop();
	if (retryTimer_) retryTimer_->stop();
}

void SyncManager::requestStop()
{
	stopping_ = true;
	online_ = false;
}

void SyncManager::releaseResources()
{
	stop();
	client_.reset();
	if (store_) store_->releaseThreadConnection();
}

void SyncManager::onConnectivityChanged(ConnectivityState state)
{
	if (state == ConnectivityState::Probing) return;

	if (state == ConnectivityState::Offline) {
		online_ = false;
		sawOffline_ = true;
		lastError_ = QStringLiteral("offline");
		publishStatus();
		return;
	}

	if (stopping_) return;
	online_ = true;
	if (sawOffline_) {
		// a fresh connection starts the retry ladder over
		sawOffline_ = false;
		backoff_.reset();
		nextAttemptAt_ = 0;
		if (retryTimer_) retryTimer_->stop();
		if (lastError_ == QLatin1String("offline")) lastError_.clear();
		qCInfo(LC_SYNC) << "[SyncManager] online, draining queue";
	}
	triggerSync();
}

void SyncManager::triggerSync()
{
	if (running_) {
		rerun_ = true;
		return;
	}
	PassResult r;
	do {
		rerun_ = false;
		r = runOnce();
	} while (rerun_ && !r.transientFailure && online_);
}

SyncManager::PassResult SyncManager::runOnce()
{
	PassResult res;

	// a nested event loop inside a send can deliver another trigger
	if (running_.exchange(true)) {
		res.skipped = true;
		return res;
	}

	const qint64 now = clock_();
	if (!online_ || stopping_ || !store_ || !client_) {
		res.skipped = true;
	} else if (now < nextAttemptAt_) {
		qCDebug(LC_SYNC) << "[runOnce] backing off for" << (nextAttemptAt_ - now) << "ms";
		res.skipped = true;
	}

	if (res.skipped) {
		running_ = false;
		publishStatus();
		return res;
	}

	purgeIfDue(now);

	QVector<AttendanceEvent> queue;
	if (!store_->listPending(&queue)) {
		lastError_ = QStringLiteral("store: %1").arg(store_->lastError());
		qCWarning(LC_SYNC) << "[runOnce] listPending failed:" << lastError_;
		running_ = false;
		publishStatus();
		return res;
	}

	for (const AttendanceEvent& e : queue) {
		if (!online_ || stopping_) break;	// rest waits for the next Online

		if (!store_->markSyncing(e.eventId)) {
			lastError_ = QStringLiteral("store: %1").arg(store_->lastError());
			qCWarning(LC_SYNC) << "[runOnce] markSyncing failed:" << lastError_;
			break;
		}

		++res.attempted;
		const int attempt = e.attempts + 1;
		const DeliveryResult dr = client_->postAttendance(e);

		if (dr.status == DeliveryStatus::Delivered) {
			if (!store_->markSynced(e.eventId))
				qCWarning(LC_SYNC) << "[runOnce] markSynced failed:" << store_->lastError();
			++res.synced;
			backoff_.reset();
			nextAttemptAt_ = 0;
			lastError_.clear();
			qCDebug(LC_SYNC) << "[runOnce] synced" << e.eventId << "attempt" << attempt;
			emit eventSynced(e.eventId);
			continue;
		}

		if (dr.status == DeliveryStatus::Rejected) {
			if (!store_->markRejected(e.eventId, dr.message))
				qCWarning(LC_SYNC) << "[runOnce] markRejected failed:" << store_->lastError();
			++res.rejected;
			qCWarning(LC_SYNC) << "[runOnce] rejected" << e.eventId << "HTTP" << dr.httpStatus << dr.message;
			SystemLogger::error(QStringLiteral("SYNC"),
			                    QStringLiteral("event rejected: %1").arg(dr.message),
			                    QStringLiteral("eventId=%1 personId=%2").arg(e.eventId, e.personId));
			emit eventRejected(e.eventId, e.personId, dr.message);
			continue;
		}

		// transient: keep it queued, back off, end the pass
		if (!store_->markFailed(e.eventId, dr.message))
			qCWarning(LC_SYNC) << "[runOnce] markFailed failed:" << store_->lastError();
		res.transientFailure = true;
		lastError_ = dr.message;

		const qint64 delay = backoff_.next();
		nextAttemptAt_ = clock_() + delay;
		qCInfo(LC_SYNC) << "[runOnce]" << e.eventId << "attempt" << attempt << "failed:" << dr.message
		                << "retry in" << delay << "ms";
		if (attempt >= params_.maxAttempts) {
			qCWarning(LC_SYNC) << "[runOnce] giving up on" << e.eventId << "after" << attempt << "attempts";
			SystemLogger::warn(QStringLiteral("SYNC"),
			                   QStringLiteral("retries exhausted: %1").arg(dr.message),
			                   QStringLiteral("eventId=%1").arg(e.eventId));
		}
		scheduleRetry(delay);
		break;
	}

	running_ = false;
	publishStatus();
	return res;
}

void SyncManager::purgeIfDue(qint64 now)
{
	if (params_.retentionDays <= 0) return;
	if (lastPurgeAt_ != 0 && now - lastPurgeAt_ < kPurgeEveryMs) return;
	lastPurgeAt_ = now;

	const int removed = store_->purgeSynced(now - params_.retentionDays * kDayMs);
	if (removed > 0)
		qCInfo(LC_SYNC) << "[purge] removed" << removed << "synced event(s) older than"
		                << params_.retentionDays << "days";
}

void SyncManager::scheduleRetry(qint64 delayMs)
{
	if (!retryTimer_) return;
	retryTimer_->start(static_cast<int>(delayMs));
}

void SyncManager::publishStatus()
{
	const int pending = store_ ? store_->countPending() : 0;
	emit syncStatusChanged(qMax(0, pending), lastError_);
}
