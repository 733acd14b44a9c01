#include "fsm/face_track.hpp"
#include "log/log_categories.hpp"

FaceTrack::FaceTrack(const QString& trackId, const TrackParams& p, qint64 nowMs)
		: trackId_(trackId), p_(p), votes_(p.verifyWindowSize, p.verifyMajority),
		  firstSeenAt_(nowMs), lastSeenAt_(nowMs)
{
}

void FaceTrack::enter(TrackStatus s, qint64 nowMs)
{
		qCDebug(LC_FSM) << "[EXIT]" << trackId_ << States::toString(status_)
						<< "-> [ENTER]" << States::toString(s) << "at" << nowMs;
		status_ = s;

		switch (s) {
			case TrackStatus::Verifying:
				verifyStartedAt_ = nowMs;
				break;
			case TrackStatus::Recognized:
				candidate_ = votes_.candidate();
				resolvedAt_ = nowMs;
				outcome_ = s;
				break;
			case TrackStatus::Unknown:
				candidate_.reset();
				resolvedAt_ = nowMs;
				outcome_ = s;
				break;
			default:
				break;
		}
}

bool FaceTrack::observe(const FaceDetection& d, qint64 nowMs)
{
		lastSeenAt_ = nowMs;
		lastBox_ = d.box;
		++framesSeen_;

		history_.push_back(d.confidence);
		if ((int)history_.size() > p_.verifyWindowSize) history_.pop_front();

		// terminal for this track while it stays tracked
		if (resolved() || status_ == TrackStatus::Expired) return false;

		const bool named = d.personId.has_value() && !d.personId->isEmpty();
		if (named) matched_ = true;
		const bool strong = named && d.confidence >= p_.verifyThreshold;

		if (status_ == TrackStatus::Scanning) {
			if (!strong) return checkTimeout(nowMs);
			enter(TrackStatus::Verifying, nowMs);
		}

		// Verifying
		const bool confirmed = strong ? votes_.vote(*d.personId) : votes_.miss();
		qCDebug(LC_FSM) << "[VOTE]" << trackId_ << "candidate=" << votes_.candidate()
						<< "agree=" << votes_.agreeing() << "/" << p_.verifyMajority
						<< "conf=" << d.confidence;

		if (confirmed) {
			enter(TrackStatus::Recognized, nowMs);
			return true;
		}
		return checkTimeout(nowMs);
}

bool FaceTrack::checkTimeout(qint64 nowMs)
{
		// a weak but named match keeps scanning until it verifies or the track expires
		if (status_ == TrackStatus::Scanning && !matched_ && (nowMs - firstSeenAt_) >= p_.verifyTimeoutMs) {
			enter(TrackStatus::Unknown, nowMs);
			return true;
		}
		if (status_ == TrackStatus::Verifying && (nowMs - verifyStartedAt_) >= p_.verifyTimeoutMs) {
			enter(TrackStatus::Unknown, nowMs);
			return true;
		}
		return false;
}

bool FaceTrack::expire(qint64 nowMs)
{
		bool resolvedNow = false;
		if (!resolved() && status_ != TrackStatus::Expired) {
			// report at the last time the face was actually seen
			enter(TrackStatus::Unknown, lastSeenAt_);
			resolvedNow = true;
		}
		if (status_ != TrackStatus::Expired) {
			qCDebug(LC_FSM) << "[EXPIRE]" << trackId_ << "unseen for" << (nowMs - lastSeenAt_) << "ms";
			status_ = TrackStatus::Expired;
		}
		return resolvedNow;
}
