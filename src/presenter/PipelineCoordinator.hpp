#pragma once
#include <functional>
#include <memory>
#include <QObject>
#include <QThread>
#include <QVector>
#include <opencv2/core.hpp>

#include "config/KioskConfig.hpp"
#include "include/LogDtos.hpp"
#include "include/types.hpp"
#include "net/BackendClient.hpp"

class EventStore;
class FaceTrackService;
class ConnectivityMonitor;
class SyncManager;
class IVisionProvider;

struct PipelineStats {
	int frames = 0;
	int skippedFrames = 0;
	int checkIns = 0;
	int checkOuts = 0;
	int unknown = 0;
	int suppressed = 0;
	int outsideWindow = 0;
	int notSaved = 0;
	int synced = 0;
	int rejected = 0;
};

// Wires store, decisioning, monitor and sync together and owns their threads.
class PipelineCoordinator : public QObject {
	Q_OBJECT
public:
	// One client per background component; defaults to HttpBackendClient
	using BackendFactory = std::function<std::unique_ptr<IBackendClient>()>;

	explicit PipelineCoordinator(const KioskConfig& cfg, BackendFactory factory = {}, QObject* parent = nullptr);
	~PipelineCoordinator() override;

	// Opens the store (throws StoreError), restores cooldowns, starts monitor and sync threads
	void start();

	// Background work finishes or times out within app.shutdownGraceMs; the store is closed last
	void shutdown();

	void setVisionProvider(IVisionProvider* provider) { vision_ = provider; }

	// false when the frame was skipped
	bool onFrame(const cv::Mat& frame, qint64 capturedAtMs);
	bool submitDetections(const DetectionFrame& frame);

	bool selectSystemLogs(int offset, int limit, int minLevel, const QString& tagLike, const QString& sinceIso,
	                      QVector<SystemLog>* outRows, int* outTotal);

	const PipelineStats& stats() const { return stats_; }
	bool isRunning() const { return running_; }

	EventStore* store() const { return store_.get(); }
	FaceTrackService* tracks() const { return tracks_.get(); }
	SyncManager* syncManager() const { return sync_; }
	ConnectivityMonitor* monitor() const { return monitor_; }

public slots:
	void tick();

signals:
	void decisionEmitted(const AttendanceDecision& d);
	void syncStatusChanged(int pendingCount, const QString& lastError);
	void connectivityChanged(ConnectivityState state);
	void eventRejected(const QString& eventId, const QString& personId, const QString& reason);
	void attendanceNotSaved(const QString& personId, const QString& error);
	// vision source has no more frames and every open track has been reported
	void sourceExhausted();

private:
	void countDecision(const AttendanceDecision& d);
	void stopThread(QThread* th, const char* name, int graceMs);

	KioskConfig cfg_;
	BackendFactory factory_;

	std::unique_ptr<EventStore> store_;
	std::unique_ptr<FaceTrackService> tracks_;
	IVisionProvider* vision_ = nullptr;

	QThread* monitorThread_ = nullptr;
	QThread* syncThread_ = nullptr;
	ConnectivityMonitor* monitor_ = nullptr;
	SyncManager* sync_ = nullptr;

	PipelineStats stats_;
	bool running_ = false;
};
