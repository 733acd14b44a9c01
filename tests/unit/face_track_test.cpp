#include "fsm/face_track.hpp"
#include "fsm/VoteWindow.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <QCoreApplication>

namespace {

using test_support::localMs;

FaceDetection Face(const QString& track, const QString& person, double conf) {
	FaceDetection d;
	d.trackId = track;
	d.box = cv::Rect(10, 10, 80, 80);
	if (!person.isEmpty()) d.personId = person;
	d.confidence = conf;
	return d;
}

void TestVoteWindowRestartsOnNewCandidate() {
	VoteWindow w(3, 2);
	assert(!w.vote("P1"));
	assert(!w.vote("P2"));
	assert(w.candidate() == "P2");
	assert(w.agreeing() == 1);
	assert(w.vote("P2"));
}

void TestVoteWindowMissesSlideOut() {
	VoteWindow w(3, 2);
	assert(!w.vote("P1"));
	assert(!w.miss());
	assert(!w.miss());
	// oldest P1 vote dropped out of the window
	assert(!w.vote("P1"));
	assert(w.vote("P1"));
}

void TestTwoOfThreeRecognizesOnSecondFrame() {
	TrackParams p;
	const qint64 t0 = localMs(9, 0);
	FaceTrack t("t1", p, t0);

	assert(!t.observe(Face("t1", "P1", 0.90), t0));
	assert(t.status() == TrackStatus::Verifying);

	assert(t.observe(Face("t1", "P1", 0.92), t0 + 33));
	assert(t.status() == TrackStatus::Recognized);
	assert(t.candidatePersonId() && *t.candidatePersonId() == "P1");
	assert(t.resolvedAt() == t0 + 33);

	// a third, weak frame does not change the outcome
	assert(!t.observe(Face("t1", "P1", 0.10), t0 + 66));
	assert(t.status() == TrackStatus::Recognized);
	assert(t.framesSeen() == 3);
	assert(t.confidenceHistory().size() == 3);
}

void TestAlternatingIdentitiesTimeOutUnknown() {
	TrackParams p;
	const qint64 t0 = localMs(9, 0);
	FaceTrack t("t2", p, t0);

	bool resolved = false;
	for (int i = 0; i <= 20 && !resolved; ++i) {
		const QString who = (i % 2 == 0) ? "P1" : "P2";
		resolved = t.observe(Face("t2", who, 0.95), t0 + i * 100);
		assert(t.status() != TrackStatus::Recognized);
	}
	assert(resolved);
	assert(t.status() == TrackStatus::Unknown);
	assert(!t.candidatePersonId());
	assert(t.resolvedAt() == t0 + p.verifyTimeoutMs);
}

void TestUnmatchedFramesTimeOutUnknown() {
	TrackParams p;
	const qint64 t0 = localMs(9, 0);
	FaceTrack t("t3", p, t0);

	assert(!t.observe(Face("t3", "", 0.0), t0));
	assert(!t.observe(Face("t3", "", 0.0), t0 + 500));
	assert(t.status() == TrackStatus::Scanning);
	assert(!t.everMatched());

	assert(!t.checkTimeout(t0 + p.verifyTimeoutMs - 1));
	assert(t.checkTimeout(t0 + p.verifyTimeoutMs));
	assert(t.status() == TrackStatus::Unknown);
	assert(t.outcome() == TrackStatus::Unknown);
}

void TestSlowApproachStillRecognized() {
	TrackParams p;
	const qint64 t0 = localMs(9, 0);
	FaceTrack t("t6", p, t0);

	// named but below threshold for longer than the verify timeout
	for (qint64 at = t0; at <= t0 + p.verifyTimeoutMs + 100; at += 100) {
		assert(!t.observe(Face("t6", "P1", 0.7), at));
		assert(t.status() == TrackStatus::Scanning);
	}
	assert(!t.checkTimeout(t0 + p.verifyTimeoutMs + 150));
	assert(t.status() == TrackStatus::Scanning);

	const qint64 t1 = t0 + p.verifyTimeoutMs + 133;
	assert(!t.observe(Face("t6", "P1", 0.95), t1));
	assert(t.status() == TrackStatus::Verifying);
	assert(t.observe(Face("t6", "P1", 0.95), t1 + 33));
	assert(t.status() == TrackStatus::Recognized);
	assert(t.candidatePersonId() && *t.candidatePersonId() == "P1");
	assert(t.resolvedAt() == t1 + 33);
}

void TestExpireResolvesLongUndecidedTrack() {
	TrackParams p;
	const qint64 t0 = localMs(9, 0);
	FaceTrack t("t4", p, t0);

	t.observe(Face("t4", "P1", 0.5), t0);
	t.observe(Face("t4", "P1", 0.5), t0 + 100);
	t.observe(Face("t4", "P1", 0.5), t0 + 200);

	assert(!t.isStale(t0 + 200 + p.trackExpiryMs));
	assert(t.isStale(t0 + 201 + p.trackExpiryMs));

	assert(t.expire(t0 + 201 + p.trackExpiryMs));
	assert(t.resolvedAt() == t0 + 200);
	assert(t.status() == TrackStatus::Expired);
}

void TestExpireShortTrackReportsUnknown() {
	TrackParams p;
	const qint64 t0 = localMs(9, 0);
	FaceTrack t("t5", p, t0);

	t.observe(Face("t5", "P1", 0.95), t0);
	assert(t.status() == TrackStatus::Verifying);
	assert(t.expire(t0 + 5000));
	assert(t.status() == TrackStatus::Expired);
	assert(t.outcome() == TrackStatus::Unknown);
	assert(!t.candidatePersonId());
	assert(t.resolvedAt() == t0);
	assert(!t.observe(Face("t5", "P1", 0.95), t0 + 5001));
	assert(!t.expire(t0 + 6000));

	FaceTrack never("t7", p, t0);
	never.observe(Face("t7", "", 0.0), t0);
	assert(never.expire(t0 + 5000));
	assert(never.outcome() == TrackStatus::Unknown);
}

void TestRecognizedTrackExpiresWithoutSecondDecision() {
	TrackParams p;
	const qint64 t0 = localMs(9, 0);
	FaceTrack t("t8", p, t0);

	t.observe(Face("t8", "P1", 0.9), t0);
	assert(t.observe(Face("t8", "P1", 0.9), t0 + 33));
	assert(!t.expire(t0 + 5000));
	assert(t.status() == TrackStatus::Expired);
	assert(t.outcome() == TrackStatus::Recognized);
}

} // namespace

int main(int argc, char** argv) {
	QCoreApplication app(argc, argv);

	TestVoteWindowRestartsOnNewCandidate();
	TestVoteWindowMissesSlideOut();
	TestTwoOfThreeRecognizesOnSecondFrame();
	TestAlternatingIdentitiesTimeOutUnknown();
	TestUnmatchedFramesTimeOutUnknown();
	TestSlowApproachStillRecognized();
	TestExpireResolvesLongUndecidedTrack();
	TestExpireShortTrackReportsUnknown();
	TestRecognizedTrackExpiresWithoutSecondDecision();

	std::cout << "attendance_unit_face_track: pass\n";
	return 0;
}
