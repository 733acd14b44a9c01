#pragma once
#include <vector>
#include <optional>
#include <QString>
#include <QMetaType>
#include <opencv2/core.hpp>
#include "include/states.hpp"

// One face reported by the vision provider for a single frame
struct FaceDetection {
	QString					trackId;			// provider-assigned, stable while tracked
	cv::Rect				box;
	std::optional<QString>	personId;			// empty -> no gallery match
	double					confidence = 0.0;	// 0..1
};

struct DetectionFrame {
	qint64						capturedAtMs = 0;	// epoch ms, capture time
	std::vector<FaceDetection>	faces;				// provider order
};

// Durable unit of record
struct AttendanceEvent {
	QString		eventId;				// idempotency key, never regenerated
	QString		personId;
	QString		deviceId;
	qint64		occurredAtMs = 0;		// capture time
	EventKind	kind = EventKind::CheckIn;
	QString		window;					// e.g. "2026-10-19/morning-in"
	SyncStatus	syncStatus = SyncStatus::Pending;
	int			attempts = 0;
	QString		lastError;
	bool		permanent = false;		// rejected by backend, never resent
	qint64		updatedAtMs = 0;
};

// Emitted once per track at Recognized/Unknown
struct AttendanceDecision {
	QString					trackId;
	std::optional<QString>	personId;
	DecisionOutcome			outcome = DecisionOutcome::UnknownFace;
	EventKind				kind = EventKind::CheckIn;
	QString					window;
	qint64					decidedAtMs = 0;
	std::optional<QString>	eventId;
	double					confidence = 0.0;
	cv::Rect				box;
};

Q_DECLARE_METATYPE(AttendanceEvent)
Q_DECLARE_METATYPE(AttendanceDecision)
