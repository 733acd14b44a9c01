#pragma once
#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>

#include "fsm/track_params.hpp"
#include "net/BackendClient.hpp"
#include "services/AttendanceWindows.hpp"
#include "services/ConnectivityMonitor.hpp"
#include "services/SyncManager.hpp"

// Runtime configuration. Defaults apply to every key the file leaves out.
struct KioskConfig {
	BackendParams			backend;
	TrackParams				track;
	qint64					cooldownMs = 0;
	std::vector<WindowRule>	windows = AttendanceWindows::defaultRules();
	SyncParams				sync;
	ProbeParams				probe;

	QString					storePath = QStringLiteral("data/attendance.db");
	int						storeRetryCount = 1;
	QString					logDir = QStringLiteral("logs");
	int						fps = 30;
	int						shutdownGraceMs = 5000;

	// Throws ConfigError. An empty path means defaults plus environment.
	static KioskConfig load(const QString& path,
	                        const QProcessEnvironment& env = QProcessEnvironment::systemEnvironment());

	static KioskConfig fromJson(const QJsonObject& root);

	void applyEnvironment(const QProcessEnvironment& env);

	// Throws ConfigError naming the first bad key
	void validate() const;
};
