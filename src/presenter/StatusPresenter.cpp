#include "presenter/StatusPresenter.hpp"
#include "presenter/PipelineCoordinator.hpp"
#include "log/log_categories.hpp"
#include <QDateTime>
#include <QDebug>

StatusPresenter::StatusPresenter(PipelineCoordinator* pipeline, QObject* p)
		: QObject(p)
{
		if (!pipeline) return;

		connect(pipeline, &PipelineCoordinator::decisionEmitted, this, &StatusPresenter::presentDecision);
		connect(pipeline, &PipelineCoordinator::syncStatusChanged, this, &StatusPresenter::presentSyncStatus);
		connect(pipeline, &PipelineCoordinator::connectivityChanged, this, &StatusPresenter::presentConnectivity);
		connect(pipeline, &PipelineCoordinator::eventRejected, this, &StatusPresenter::presentRejection);
		connect(pipeline, &PipelineCoordinator::attendanceNotSaved, this, &StatusPresenter::presentNotSaved);
}

QString StatusPresenter::describe(const AttendanceDecision& d)
{
		const QString who = d.personId ? *d.personId : QStringLiteral("unknown");
		const QString at = QDateTime::fromMSecsSinceEpoch(d.decidedAtMs).toString(QStringLiteral("HH:mm:ss"));

		switch (d.outcome) {
			case DecisionOutcome::Recorded:
				return QStringLiteral("%1 %2 at %3").arg(who,
						d.kind == EventKind::CheckIn ? QStringLiteral("checked in") : QStringLiteral("checked out"), at);
			case DecisionOutcome::CooldownSuppressed:
				return QStringLiteral("%1 already recorded (%2)").arg(who, d.window);
			case DecisionOutcome::UnknownFace:
				return QStringLiteral("Unknown face (track %1)").arg(d.trackId);
			case DecisionOutcome::OutsideWindow:
				return QStringLiteral("%1 recognized outside attendance hours").arg(who);
			case DecisionOutcome::NotSaved:
				return QStringLiteral("Attendance not saved for %1").arg(who);
		}
		return QString();
}

void StatusPresenter::presentDecision(const AttendanceDecision& d)
{
		show(describe(d));
}

void StatusPresenter::presentSyncStatus(int pendingCount, const QString& lastError)
{
		// while offline every report is shown again
		if (connectivity_ == ConnectivityState::Online && pendingCount == pending_ && lastError == lastError_)
			return;
		pending_ = pendingCount;
		lastError_ = lastError;
		emit statusChanged(statusLine());
		qCInfo(LC_PIPELINE).noquote() << "[Status]" << statusLine();
}

void StatusPresenter::presentConnectivity(ConnectivityState state)
{
		// Probing is transient; keep showing the last settled state
		if (state == ConnectivityState::Probing) return;
		if (state == ConnectivityState::Online) {
			if (connectivity_ == ConnectivityState::Online) return;
			connectivity_ = state;
			show(QStringLiteral("Backend online"));
			return;
		}
		// Offline stays on screen: repeated on every failed probe
		connectivity_ = state;
		show(QStringLiteral("Offline: attendance is stored locally (pending %1)").arg(pending_));
}

void StatusPresenter::presentRejection(const QString& eventId, const QString& personId, const QString& reason)
{
		show(QStringLiteral("Rejected by server: %1 (%2) %3").arg(personId, eventId, reason));
}

void StatusPresenter::presentNotSaved(const QString& personId, const QString& error)
{
		show(QStringLiteral("Attendance not saved for %1: %2").arg(personId, error));
}

QString StatusPresenter::statusLine() const
{
		QString line = QStringLiteral("%1 | pending %2").arg(States::toString(connectivity_)).arg(pending_);
		if (!lastError_.isEmpty()) line += QStringLiteral(" | last error: %1").arg(lastError_);
		return line;
}

void StatusPresenter::show(const QString& msg)
{
		lastMessage_ = msg;
		qCInfo(LC_PIPELINE).noquote() << "[Display]" << msg;
		emit statusChanged(msg);
}
