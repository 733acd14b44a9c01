#pragma once
#include <QObject>
#include <QString>

#include "include/states.hpp"
#include "include/types.hpp"

class PipelineCoordinator;

// Headless view: turns pipeline notifications into operator-facing log lines.
class StatusPresenter : public QObject {
		Q_OBJECT

public:
		explicit StatusPresenter(PipelineCoordinator* pipeline, QObject* parent = nullptr);

		QString statusLine() const;
		QString lastMessage() const { return lastMessage_; }
		ConnectivityState connectivity() const { return connectivity_; }
		int pendingCount() const { return pending_; }

		static QString describe(const AttendanceDecision& d);

public slots:
		void presentDecision(const AttendanceDecision& d);
		void presentSyncStatus(int pendingCount, const QString& lastError);
		void presentConnectivity(ConnectivityState state);
		void presentRejection(const QString& eventId, const QString& personId, const QString& reason);
		void presentNotSaved(const QString& personId, const QString& error);

signals:
		void statusChanged(const QString& line);

private:
		void show(const QString& msg);

		ConnectivityState connectivity_ = ConnectivityState::Offline;
		int pending_ = 0;
		QString lastError_;
		QString lastMessage_;
};
