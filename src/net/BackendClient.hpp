#pragma once
#include <QString>
#include "include/types.hpp"

struct BackendParams {
	QString	baseUrl = QStringLiteral("http://localhost:8000");
	QString	deviceId = QStringLiteral("stb-01");
	QString	deviceToken;
	int		timeoutMs = 12000;			// POST /attendance
	int		healthTimeoutMs = 3000;		// GET /health
};

enum class DeliveryStatus {
	Delivered,		// 2xx, or 409 already recorded
	Transient,		// timeout, connection error, 5xx, 408, 429
	Rejected		// any other 4xx; never resent
};

struct DeliveryResult {
	DeliveryStatus	status = DeliveryStatus::Transient;
	int				httpStatus = 0;		// 0 when no response arrived
	QString			message;
};

// Attendance backend seam. Calls block the calling thread; never call from the decisioning path.
class IBackendClient {
public:
	virtual ~IBackendClient() = default;

	virtual DeliveryResult postAttendance(const AttendanceEvent& e) = 0;
	virtual bool checkHealth() = 0;
};
