#pragma once
#include <deque>
#include <optional>
#include <QString>
#include <opencv2/core.hpp>

#include "fsm/VoteWindow.hpp"
#include "fsm/track_params.hpp"
#include "include/states.hpp"
#include "include/types.hpp"

// Automaton for one continuously tracked face.
// Scanning -> Verifying -> {Recognized | Unknown} -> Expired, forward only.
class FaceTrack {
public:
		FaceTrack(const QString& trackId, const TrackParams& p, qint64 nowMs);

		// Feed this frame's detection. true when the track resolved on this frame.
		bool observe(const FaceDetection& d, qint64 nowMs);

		// Time-based resolution (verify timeout). true when resolved now.
		bool checkTimeout(qint64 nowMs);

		bool isStale(qint64 nowMs) const { return (nowMs - lastSeenAt_) > p_.trackExpiryMs; }

		// Called once the track is stale. An undecided track resolves to Unknown first
		// (returns true), then the track is marked Expired.
		bool expire(qint64 nowMs);

		bool resolved() const { return status_ == TrackStatus::Recognized || status_ == TrackStatus::Unknown; }

		const QString&			trackId() const { return trackId_; }
		TrackStatus				status() const { return status_; }
		// Recognized or Unknown once decided, kept after the track expires
		TrackStatus				outcome() const { return outcome_; }
		bool					everMatched() const { return matched_; }
		std::optional<QString>	candidatePersonId() const { return candidate_; }
		const std::deque<double>& confidenceHistory() const { return history_; }
		qint64					firstSeenAt() const { return firstSeenAt_; }
		qint64					lastSeenAt() const { return lastSeenAt_; }
		qint64					resolvedAt() const { return resolvedAt_; }
		int						framesSeen() const { return framesSeen_; }
		double					lastConfidence() const { return history_.empty() ? 0.0 : history_.back(); }
		const cv::Rect&			lastBox() const { return lastBox_; }

private:
		void enter(TrackStatus s, qint64 nowMs);

		QString					trackId_;
		TrackParams				p_;
		TrackStatus				status_ = TrackStatus::Scanning;
		TrackStatus				outcome_ = TrackStatus::Scanning;
		VoteWindow				votes_;
		std::optional<QString>	candidate_;
		std::deque<double>		history_;
		cv::Rect				lastBox_;

		qint64	firstSeenAt_	= 0;
		qint64	lastSeenAt_		= 0;
		qint64	verifyStartedAt_ = 0;
		qint64	resolvedAt_		= 0;
		int		framesSeen_		= 0;
		bool	matched_		= false;
};
