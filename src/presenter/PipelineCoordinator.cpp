#include "presenter/PipelineCoordinator.hpp"

#include "include/errors.hpp"
#include "log/log_categories.hpp"
#include "log/SystemLogger.hpp"
#include "net/HttpBackendClient.hpp"
#include "services/ConnectivityMonitor.hpp"
#include "services/EventStore.hpp"
#include "services/FaceTrackService.hpp"
#include "services/SyncManager.hpp"
#include "vision/VisionProvider.hpp"

#include <QDateTime>
#include <QDeadlineTimer>
#include <QDebug>

PipelineCoordinator::PipelineCoordinator(const KioskConfig& cfg, BackendFactory factory, QObject* p)
	: QObject(p), cfg_(cfg), factory_(std::move(factory))
{
	qRegisterMetaType<ConnectivityState>("ConnectivityState");
	qRegisterMetaType<AttendanceEvent>("AttendanceEvent");
	qRegisterMetaType<AttendanceDecision>("AttendanceDecision");

	if (!factory_) {
		const BackendParams bp = cfg_.backend;
		factory_ = [bp] { return std::unique_ptr<IBackendClient>(new HttpBackendClient(bp)); };
	}

	store_ = std::make_unique<EventStore>(cfg_.storePath);
	store_->setRetryCeiling(cfg_.sync.maxAttempts);

	tracks_ = std::make_unique<FaceTrackService>(store_.get(), cfg_.track, AttendanceWindows(cfg_.windows),
	                                             cfg_.cooldownMs, cfg_.backend.deviceId, cfg_.storeRetryCount);

	// decisioning stays on this thread
	connect(tracks_.get(), &FaceTrackService::decisionEmitted, this, [this](const AttendanceDecision& d) {
		countDecision(d);
		emit decisionEmitted(d);
	});
	connect(tracks_.get(), &FaceTrackService::attendanceNotSaved, this, &PipelineCoordinator::attendanceNotSaved);

	monitor_ = new ConnectivityMonitor(factory_(), cfg_.probe);
	monitorThread_ = new QThread();
	monitorThread_->setObjectName(QStringLiteral("monitor"));
	monitor_->moveToThread(monitorThread_);

	sync_ = new SyncManager(store_.get(), factory_(), cfg_.sync);
	syncThread_ = new QThread();
	syncThread_->setObjectName(QStringLiteral("sync"));
	sync_->moveToThread(syncThread_);

	// lifetime
	connect(monitorThread_, &QThread::started, monitor_, &ConnectivityMonitor::start);
	connect(monitorThread_, &QThread::finished, monitor_, &ConnectivityMonitor::releaseResources, Qt::DirectConnection);
	connect(monitorThread_, &QThread::finished, monitor_, &QObject::deleteLater);

	connect(syncThread_, &QThread::started, sync_, &SyncManager::start);
	connect(syncThread_, &QThread::finished, sync_, &SyncManager::releaseResources, Qt::DirectConnection);
	connect(syncThread_, &QThread::finished, sync_, &QObject::deleteLater);

	// monitor -> sync
	connect(monitor_, &ConnectivityMonitor::stateChanged, sync_, &SyncManager::onConnectivityChanged, Qt::QueuedConnection);
	// new appends nudge delivery
	connect(tracks_.get(), &FaceTrackService::eventRecorded, sync_, &SyncManager::triggerSync, Qt::QueuedConnection);

	// status back to this thread
	connect(monitor_, &ConnectivityMonitor::stateChanged, this, &PipelineCoordinator::connectivityChanged, Qt::QueuedConnection);
	connect(sync_, &SyncManager::syncStatusChanged, this, &PipelineCoordinator::syncStatusChanged, Qt::QueuedConnection);
	connect(sync_, &SyncManager::eventSynced, this, [this](const QString&) { ++stats_.synced; }, Qt::QueuedConnection);
	connect(sync_, &SyncManager::eventRejected, this, [this](const QString& id, const QString& person, const QString& reason) {
		++stats_.rejected;
		emit eventRejected(id, person, reason);
	}, Qt::QueuedConnection);

	qCDebug(LC_PIPELINE) << "[PipelineCoordinator] monitor thread:" << monitorThread_ << "sync thread:" << syncThread_;
}

PipelineCoordinator::~PipelineCoordinator()
{
	shutdown();
}

void PipelineCoordinator::start()
{
	if (running_) return;

	if (!store_->initializeDatabase())
		throw StoreError(QStringLiteral("cannot open event store %1: %2").arg(store_->path(), store_->lastError()));

	const int restored = tracks_->restoreCooldowns(QDateTime::currentMSecsSinceEpoch());
	const int pending = store_->countPending();
	qCInfo(LC_PIPELINE) << "[start] store" << store_->path() << "pending=" << pending << "cooldowns=" << restored;
	SystemLogger::info(QStringLiteral("APP"), QStringLiteral("pipeline started"),
	                   QStringLiteral("device=%1 pending=%2").arg(cfg_.backend.deviceId).arg(pending));

	monitorThread_->start();
	syncThread_->start();
	running_ = true;
}

void PipelineCoordinator::stopThread(QThread* th, const char* name, int graceMs)
{
	if (!th) return;
	th->quit();
	if (!th->wait(QDeadlineTimer(graceMs))) {
		qCWarning(LC_PIPELINE) << "[shutdown]" << name << "thread did not stop in" << graceMs << "ms";
		th->terminate();
		th->wait();
	}
}

void PipelineCoordinator::shutdown()
{
	if (!monitorThread_ && !syncThread_) return;

	const int grace = cfg_.shutdownGraceMs;
	if (running_) {
		// let an in-flight send complete or time out
		sync_->requestStop();
		QDeadlineTimer deadline(grace);
		while (sync_->isBusy() && !deadline.hasExpired())
			QThread::msleep(20);

		QMetaObject::invokeMethod(monitor_, &ConnectivityMonitor::stop, Qt::QueuedConnection);
		QMetaObject::invokeMethod(sync_, &SyncManager::stop, Qt::QueuedConnection);
		stopThread(monitorThread_, "monitor", grace);
		stopThread(syncThread_, "sync", grace);
	} else {
		// never started: workers were not moved into running threads
		delete monitor_;
		delete sync_;
	}

	delete monitorThread_;
	delete syncThread_;
	monitorThread_ = nullptr;
	syncThread_ = nullptr;
	monitor_ = nullptr;
	sync_ = nullptr;

	if (running_) {
		qCInfo(LC_PIPELINE) << "[shutdown] frames=" << stats_.frames << "in=" << stats_.checkIns
		                    << "out=" << stats_.checkOuts << "unknown=" << stats_.unknown
		                    << "synced=" << stats_.synced << "pending=" << store_->countPending();
		SystemLogger::info(QStringLiteral("APP"), QStringLiteral("pipeline stopped"));
	}
	running_ = false;

	// store last
	store_->releaseThreadConnection();
}

void PipelineCoordinator::tick()
{
	if (!vision_) return;
	if (!vision_->hasMore()) {
		// empty frames let open tracks expire and report before the source is declared done
		if (tracks_->activeTrackCount() > 0
		    && !submitDetections(DetectionFrame{ QDateTime::currentMSecsSinceEpoch(), {} }))
			return;
		if (tracks_->activeTrackCount() == 0)
			emit sourceExhausted();
		return;
	}
	onFrame(cv::Mat(), QDateTime::currentMSecsSinceEpoch());
}

bool PipelineCoordinator::onFrame(const cv::Mat& frame, qint64 capturedAtMs)
{
	if (!vision_) return false;

	DetectionFrame df;
	df.capturedAtMs = capturedAtMs;
	try {
		df.faces = vision_->detect(frame, capturedAtMs);
	} catch (const VisionInputError& e) {
		++stats_.frames;
		++stats_.skippedFrames;
		qCWarning(LC_PIPELINE) << "[onFrame] frame skipped:" << e.what();
		return false;
	}
	return submitDetections(df);
}

bool PipelineCoordinator::submitDetections(const DetectionFrame& frame)
{
	++stats_.frames;
	try {
		tracks_->processFrame(frame);
	} catch (const VisionInputError& e) {
		++stats_.skippedFrames;
		qCWarning(LC_PIPELINE) << "[submitDetections] frame skipped:" << e.what();
		return false;
	}
	return true;
}

void PipelineCoordinator::countDecision(const AttendanceDecision& d)
{
	switch (d.outcome) {
		case DecisionOutcome::Recorded:
			if (d.kind == EventKind::CheckIn) ++stats_.checkIns;
			else ++stats_.checkOuts;
			break;
		case DecisionOutcome::CooldownSuppressed:	++stats_.suppressed;	break;
		case DecisionOutcome::UnknownFace:			++stats_.unknown;		break;
		case DecisionOutcome::OutsideWindow:		++stats_.outsideWindow;	break;
		case DecisionOutcome::NotSaved:				++stats_.notSaved;		break;
	}
}

bool PipelineCoordinator::selectSystemLogs(int offset, int limit, int minLevel, const QString& tagLike,
                                           const QString& sinceIso, QVector<SystemLog>* outRows, int* outTotal)
{
	return store_->selectSystemLogs(offset, limit, minLevel, tagLike, sinceIso, outRows, outTotal);
}
