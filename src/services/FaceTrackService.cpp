#include "services/FaceTrackService.hpp"
#include "services/EventStore.hpp"
#include "include/errors.hpp"
#include "log/log_categories.hpp"
#include "log/SystemLogger.hpp"

#include <cmath>
#include <set>
#include <QUuid>
#include <QDebug>

static constexpr qint64 kCooldownLookbackMs = 24LL * 60 * 60 * 1000;

FaceTrackService::FaceTrackService(EventStore* store,
                                   const TrackParams& params,
                                   const AttendanceWindows& windows,
                                   qint64 cooldownMs,
                                   const QString& deviceId,
                                   int storeRetryCount,
                                   QObject* parent)
	: QObject(parent)
	, store_(store)
	, params_(params)
	, windows_(windows)
	, cooldowns_(cooldownMs)
	, deviceId_(deviceId)
	, storeRetryCount_(qMax(0, storeRetryCount))
	, newId_([] { return QUuid::createUuid().toString(QUuid::WithoutBraces); })
{
}

const FaceTrack* FaceTrackService::track(const QString& trackId) const
{
	const auto it = tracks_.find(trackId);
	return it == tracks_.end() ? nullptr : &it->second;
}

void FaceTrackService::validateFrame(const DetectionFrame& frame)
{
	if (frame.capturedAtMs <= 0)
		throw VisionInputError(QStringLiteral("frame without capture time"));

	for (const FaceDetection& f : frame.faces) {
		if (f.trackId.isEmpty())
			throw VisionInputError(QStringLiteral("detection without trackId"));
		if (std::isnan(f.confidence) || f.confidence < 0.0 || f.confidence > 1.0)
			throw VisionInputError(QStringLiteral("confidence out of range for track %1").arg(f.trackId));
		if (f.box.width < 0 || f.box.height < 0)
			throw VisionInputError(QStringLiteral("negative bbox for track %1").arg(f.trackId));
	}
}

std::vector<AttendanceDecision> FaceTrackService::processFrame(const DetectionFrame& frame)
{
	validateFrame(frame);

	const qint64 now = frame.capturedAtMs;
	std::vector<AttendanceDecision> out;
	std::set<QString> seen;

	for (const FaceDetection& f : frame.faces) {
		if (!seen.insert(f.trackId).second) {
			qCDebug(LC_FSM) << "[processFrame] duplicate track in frame, ignored:" << f.trackId;
			continue;
		}

		auto it = tracks_.find(f.trackId);
		if (it == tracks_.end()) {
			if (activeTrackCount() >= params_.maxTracks) {
				qCDebug(LC_FSM) << "[processFrame] track limit" << params_.maxTracks << "reached, ignoring" << f.trackId;
				continue;
			}
			it = tracks_.emplace(f.trackId, FaceTrack(f.trackId, params_, now)).first;
		}

		if (it->second.observe(f, now))
			out.push_back(decide(it->second));
	}

	// tracks missing from this frame can still hit the verify timeout
	for (auto& [id, t] : tracks_) {
		if (seen.count(id) || t.resolved()) continue;
		if (t.checkTimeout(now))
			out.push_back(decide(t));
	}

	auto expired = expireStale(now);
	out.insert(out.end(), expired.begin(), expired.end());
	return out;
}

std::vector<AttendanceDecision> FaceTrackService::expireStale(qint64 nowMs)
{
	std::vector<AttendanceDecision> out;
	for (auto it = tracks_.begin(); it != tracks_.end(); ) {
		FaceTrack& t = it->second;
		if (!t.isStale(nowMs)) { ++it; continue; }

		if (t.expire(nowMs))
			out.push_back(decide(t));
		it = tracks_.erase(it);
	}
	return out;
}

AttendanceDecision FaceTrackService::decide(const FaceTrack& t)
{
	AttendanceDecision d;
	d.trackId = t.trackId();
	d.decidedAtMs = t.resolvedAt();
	d.confidence = t.lastConfidence();
	d.box = t.lastBox();

	if (t.outcome() == TrackStatus::Unknown) {
		d.outcome = DecisionOutcome::UnknownFace;
		qCInfo(LC_FSM) << "[decide]" << d.trackId << "unknown after" << t.framesSeen() << "frame(s)";
		SystemLogger::info(QStringLiteral("FSM"), QStringLiteral("unknown face"),
		                   QStringLiteral("track=%1").arg(d.trackId));
		emit decisionEmitted(d);
		return d;
	}

	d.personId = t.candidatePersonId();
	const auto match = windows_.resolve(d.decidedAtMs);
	if (!match) {
		d.outcome = DecisionOutcome::OutsideWindow;
		qCInfo(LC_FSM) << "[decide]" << d.trackId << *d.personId << "outside every attendance window";
		emit decisionEmitted(d);
		return d;
	}

	d.kind = match->kind;
	d.window = match->key;

	if (cooldowns_.isFresh(*d.personId, match->key, d.decidedAtMs)) {
		d.outcome = DecisionOutcome::CooldownSuppressed;
		qCInfo(LC_FSM) << "[decide]" << d.trackId << *d.personId << "already recorded in" << match->key;
		emit decisionEmitted(d);
		return d;
	}

	d = recordAttendance(t, d);
	emit decisionEmitted(d);
	return d;
}

AttendanceDecision FaceTrackService::recordAttendance(const FaceTrack& t, AttendanceDecision d)
{
	AttendanceEvent e;
	e.eventId = newId_();
	e.personId = *d.personId;
	e.deviceId = deviceId_;
	e.occurredAtMs = t.resolvedAt();
	e.kind = d.kind;
	e.window = d.window;

	QString err;
	if (!appendWithRetry(e, &err)) {
		d.outcome = DecisionOutcome::NotSaved;
		qCCritical(LC_FSM) << "[decide] attendance not saved for" << e.personId << ":" << err;
		SystemLogger::error(QStringLiteral("STORE"), QStringLiteral("attendance not saved: %1").arg(err),
		                    QStringLiteral("personId=%1 window=%2").arg(e.personId, e.window));
		emit attendanceNotSaved(e.personId, err);
		return d;
	}

	cooldowns_.record(e.personId, e.window, e.occurredAtMs);
	d.outcome = DecisionOutcome::Recorded;
	d.eventId = e.eventId;

	qCInfo(LC_FSM) << "[decide]" << d.trackId << e.personId << States::toString(e.kind)
	               << "in" << e.window << "event" << e.eventId;
	SystemLogger::info(QStringLiteral("FSM"),
	                   QStringLiteral("%1 %2").arg(e.personId, States::toString(e.kind)),
	                   QStringLiteral("eventId=%1 window=%2").arg(e.eventId, e.window));
	emit eventRecorded(e);
	return d;
}

bool FaceTrackService::appendWithRetry(const AttendanceEvent& e, QString* errorOut)
{
	if (!store_) {
		if (errorOut) *errorOut = QStringLiteral("no store");
		return false;
	}
	for (int attempt = 0; attempt <= storeRetryCount_; ++attempt) {
		if (store_->append(e)) return true;
		qCWarning(LC_FSM) << "[append] attempt" << attempt + 1 << "failed:" << store_->lastError();
	}
	if (errorOut) *errorOut = store_->lastError();
	return false;
}

int FaceTrackService::restoreCooldowns(qint64 nowMs)
{
	if (!store_) return 0;

	QVector<AttendanceEvent> rows;
	if (!store_->listSince(nowMs - kCooldownLookbackMs, &rows)) {
		qCWarning(LC_FSM) << "[restoreCooldowns] listSince failed:" << store_->lastError();
		return 0;
	}

	int n = 0;
	for (const AttendanceEvent& e : rows) {
		if (e.window.isEmpty()) continue;
		cooldowns_.restore(e.personId, e.window, e.occurredAtMs);
		++n;
	}
	qCInfo(LC_FSM) << "[restoreCooldowns]" << n << "decision(s) restored," << cooldowns_.size() << "person(s)";
	return n;
}
