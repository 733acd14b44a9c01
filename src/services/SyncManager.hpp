#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <QObject>
#include <QString>

#include "include/states.hpp"
#include "net/BackendClient.hpp"
#include "services/Backoff.hpp"

class EventStore;
class QTimer;

struct SyncParams {
	int		maxAttempts = 10;
	qint64	backoffBaseMs = 2000;
	qint64	backoffCapMs = 60000;
	int		syncIntervalMs = 5000;
	int		retentionDays = 30;			// <= 0 keeps synced events forever
};

// Drains the event store to the backend, oldest first, one event at a time.
// Lives on its own thread; the store is shared with the decisioning path.
class SyncManager : public QObject {
	Q_OBJECT
public:
	using Clock = std::function<qint64()>;

	struct PassResult {
		int		attempted = 0;
		int		synced = 0;
		int		rejected = 0;
		bool	transientFailure = false;
		bool	skipped = false;		// offline, backing off, or already running
	};

	SyncManager(EventStore* store, std::unique_ptr<IBackendClient> client, const SyncParams& params,
	            QObject* parent = nullptr);
	~SyncManager() override;

	void setClock(Clock clock) { clock_ = std::move(clock); }

	// One delivery pass. Safe to call directly from tests.
	PassResult runOnce();

	bool isOnline() const { return online_.load(); }
	bool isBusy() const { return running_.load(); }

	// thread-safe; the current send finishes, nothing new starts
	void requestStop();

	qint64 nextAttemptAt() const { return nextAttemptAt_; }
	const Backoff& backoff() const { return backoff_; }
	QString lastError() const { return lastError_; }

public slots:
	void start();
	void stop();
	void releaseResources();
	void onConnectivityChanged(ConnectivityState state);
	void triggerSync();

signals:
	void syncStatusChanged(int pendingCount, const QString& lastError);
	void eventSynced(const QString& eventId);
	void eventRejected(const QString& eventId, const QString& personId, const QString& reason);

private:
	void publishStatus();
	void purgeIfDue(qint64 now);
	void scheduleRetry(qint64 delayMs);

	EventStore* store_;
	std::unique_ptr<IBackendClient> client_;
	SyncParams params_;
	Backoff backoff_;
	Clock clock_;

	QTimer* intervalTimer_ = nullptr;
	QTimer* retryTimer_ = nullptr;

	std::atomic<bool> online_ { false };
	std::atomic<bool> running_ { false };
	std::atomic<bool> stopping_ { false };
	bool sawOffline_ = true;
	bool rerun_ = false;
	qint64 nextAttemptAt_ = 0;
	qint64 lastPurgeAt_ = 0;
	QString lastError_;
};
