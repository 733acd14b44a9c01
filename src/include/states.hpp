#pragma once
#include <QObject>
#include <QString>

// Per-track recognition state
enum class TrackStatus {
	Scanning = 0,
	Verifying,			// 1
	Recognized,			// 2
	Unknown,			// 3
	Expired				// 4
};

enum class ConnectivityState {
	Offline = 0,
	Probing,
	Online
};

enum class SyncStatus {
	Pending = 0,
	Syncing,
	Synced,
	Failed
};

enum class EventKind {
	CheckIn = 0,
	CheckOut
};

// Result of a track decision, as shown to UI/voice
enum class DecisionOutcome {
	Recorded = 0,			// event written to the store
	CooldownSuppressed,		// same person, same window
	UnknownFace,			// no stable match
	OutsideWindow,			// no attendance window at capture time
	NotSaved				// store append failed after retries
};

namespace States {
	inline QString toString(TrackStatus s)
	{
		switch (s) {
			case TrackStatus::Scanning:		return QStringLiteral("Scanning");
			case TrackStatus::Verifying:	return QStringLiteral("Verifying");
			case TrackStatus::Recognized:	return QStringLiteral("Recognized");
			case TrackStatus::Unknown:		return QStringLiteral("Unknown");
			case TrackStatus::Expired:		return QStringLiteral("Expired");
		}
		return QStringLiteral("?");
	}

	inline QString toString(ConnectivityState s)
	{
		switch (s) {
			case ConnectivityState::Offline:	return QStringLiteral("Offline");
			case ConnectivityState::Probing:	return QStringLiteral("Probing");
			case ConnectivityState::Online:		return QStringLiteral("Online");
		}
		return QStringLiteral("?");
	}

	inline QString toString(SyncStatus s)
	{
		switch (s) {
			case SyncStatus::Pending:	return QStringLiteral("pending");
			case SyncStatus::Syncing:	return QStringLiteral("syncing");
			case SyncStatus::Synced:	return QStringLiteral("synced");
			case SyncStatus::Failed:	return QStringLiteral("failed");
		}
		return QStringLiteral("pending");
	}

	inline SyncStatus syncStatusFromString(const QString& s)
	{
		if (s == QLatin1String("syncing")) return SyncStatus::Syncing;
		if (s == QLatin1String("synced"))  return SyncStatus::Synced;
		if (s == QLatin1String("failed"))  return SyncStatus::Failed;
		return SyncStatus::Pending;
	}

	// Wire form used by the backend
	inline QString toString(EventKind k)
	{
		return k == EventKind::CheckOut ? QStringLiteral("check_out") : QStringLiteral("check_in");
	}

	inline EventKind eventKindFromString(const QString& s)
	{
		const QString n = s.trimmed().toLower();
		if (n == QLatin1String("check_out") || n == QLatin1String("out")) return EventKind::CheckOut;
		return EventKind::CheckIn;
	}

	inline QString toString(DecisionOutcome o)
	{
		switch (o) {
			case DecisionOutcome::Recorded:				return QStringLiteral("recorded");
			case DecisionOutcome::CooldownSuppressed:	return QStringLiteral("cooldown");
			case DecisionOutcome::UnknownFace:			return QStringLiteral("unknown");
			case DecisionOutcome::OutsideWindow:		return QStringLiteral("outside_window");
			case DecisionOutcome::NotSaved:				return QStringLiteral("not_saved");
		}
		return QStringLiteral("?");
	}
}

Q_DECLARE_METATYPE(TrackStatus)
Q_DECLARE_METATYPE(ConnectivityState)
Q_DECLARE_METATYPE(SyncStatus)
Q_DECLARE_METATYPE(EventKind)
Q_DECLARE_METATYPE(DecisionOutcome)
