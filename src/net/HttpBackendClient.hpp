#pragma once
#include <memory>
#include <QByteArray>
#include <QJsonObject>
#include "net/BackendClient.hpp"

class QNetworkAccessManager;
class QNetworkRequest;

// Qt Network implementation. Create and use on one thread only.
class HttpBackendClient final : public IBackendClient {
public:
	explicit HttpBackendClient(const BackendParams& params);
	~HttpBackendClient() override;

	DeliveryResult postAttendance(const AttendanceEvent& e) override;
	bool checkHealth() override;

	static QJsonObject toJson(const AttendanceEvent& e);
	static DeliveryResult classify(int httpStatus, bool transportError, const QString& transportMessage,
	                               const QByteArray& body);

private:
	QNetworkAccessManager* nam();
	QNetworkRequest makeRequest(const QString& path, int timeoutMs) const;

	BackendParams params_;
	std::unique_ptr<QNetworkAccessManager> nam_;
};
