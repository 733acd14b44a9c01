#pragma once
#include <functional>
#include <map>
#include <vector>
#include <QObject>
#include <QString>

#include "fsm/face_track.hpp"
#include "fsm/track_params.hpp"
#include "include/types.hpp"
#include "services/AttendanceWindows.hpp"
#include "services/CooldownRegistry.hpp"

class EventStore;

// Decisioning path: per-track state machines, cooldown and window checks, durable append.
// Single-threaded; owns the active track set and the cooldown table.
class FaceTrackService : public QObject {
	Q_OBJECT
public:
	using IdGenerator = std::function<QString()>;

	FaceTrackService(EventStore* store,
	                 const TrackParams& params,
	                 const AttendanceWindows& windows,
	                 qint64 cooldownMs,
	                 const QString& deviceId,
	                 int storeRetryCount = 1,
	                 QObject* parent = nullptr);

	// Throws VisionInputError before touching any state when the frame is malformed.
	std::vector<AttendanceDecision> processFrame(const DetectionFrame& frame);

	// Resolve or drop tracks not seen for trackExpiryMs. Also run by processFrame.
	std::vector<AttendanceDecision> expireStale(qint64 nowMs);

	// Rebuild the cooldown table from events stored in the last day; returns entries restored
	int restoreCooldowns(qint64 nowMs);

	static void validateFrame(const DetectionFrame& frame);

	void setIdGenerator(IdGenerator gen) { newId_ = std::move(gen); }

	int activeTrackCount() const { return static_cast<int>(tracks_.size()); }
	const FaceTrack* track(const QString& trackId) const;
	const CooldownRegistry& cooldowns() const { return cooldowns_; }

signals:
	void decisionEmitted(const AttendanceDecision& d);
	void eventRecorded(const AttendanceEvent& e);
	void attendanceNotSaved(const QString& personId, const QString& error);

private:
	AttendanceDecision decide(const FaceTrack& t);
	AttendanceDecision recordAttendance(const FaceTrack& t, AttendanceDecision d);
	bool appendWithRetry(const AttendanceEvent& e, QString* errorOut);

	EventStore* store_;
	TrackParams params_;
	AttendanceWindows windows_;
	CooldownRegistry cooldowns_;
	QString deviceId_;
	int storeRetryCount_;
	IdGenerator newId_;

	std::map<QString, FaceTrack> tracks_;
};
