#include "net/HttpBackendClient.hpp"
#include "log/log_categories.hpp"

#include <QDateTime>
#include <QEventLoop>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>
#include <QDebug>

namespace {
struct Reply {
	int			httpStatus = 0;
	bool		transportError = false;
	QString		errorString;
	QByteArray	body;
};

// Blocks on a local event loop until the reply finishes or the transfer timeout aborts it
Reply waitFor(QNetworkReply* reply)
{
	QEventLoop loop;
	QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
	if (!reply->isFinished()) loop.exec(QEventLoop::ExcludeUserInputEvents);
	// loop left early (thread quitting)
	if (!reply->isFinished()) reply->abort();

	Reply r;
	r.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
	r.body = reply->readAll();
	// HTTP error statuses also set error(); only a missing status means transport failure
	if (r.httpStatus == 0) {
		r.transportError = true;
		r.errorString = reply->error() == QNetworkReply::OperationCanceledError
		                    ? QStringLiteral("timeout")
		                    : reply->errorString();
	}
	reply->deleteLater();
	return r;
}
} // namespace

HttpBackendClient::HttpBackendClient(const BackendParams& params)
	: params_(params)
{
}

HttpBackendClient::~HttpBackendClient() = default;

QNetworkAccessManager* HttpBackendClient::nam()
{
	// created lazily so it belongs to the thread that uses it
	if (!nam_) nam_ = std::make_unique<QNetworkAccessManager>();
	return nam_.get();
}

QNetworkRequest HttpBackendClient::makeRequest(const QString& path, int timeoutMs) const
{
	QString base = params_.baseUrl;
	while (base.endsWith(QLatin1Char('/'))) base.chop(1);

	QNetworkRequest req(QUrl(base + path));
	req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
	req.setRawHeader("X-Device-Id", params_.deviceId.toUtf8());
	req.setRawHeader("X-Device-Token", params_.deviceToken.toUtf8());
	req.setTransferTimeout(timeoutMs);
	return req;
}

QJsonObject HttpBackendClient::toJson(const AttendanceEvent& e)
{
	QJsonObject o;
	o.insert(QStringLiteral("eventId"), e.eventId);
	o.insert(QStringLiteral("deviceId"), e.deviceId);
	o.insert(QStringLiteral("personId"), e.personId);
	o.insert(QStringLiteral("occurredAt"),
	         QDateTime::fromMSecsSinceEpoch(e.occurredAtMs).toUTC().toString(Qt::ISODateWithMs));
	o.insert(QStringLiteral("kind"), States::toString(e.kind));
	return o;
}

DeliveryResult HttpBackendClient::classify(int httpStatus, bool transportError,
                                           const QString& transportMessage, const QByteArray& body)
{
	DeliveryResult res;
	res.httpStatus = httpStatus;

	if (transportError || httpStatus == 0) {
		res.status = DeliveryStatus::Transient;
		res.message = transportMessage.isEmpty() ? QStringLiteral("no response") : transportMessage;
		return res;
	}

	if ((httpStatus >= 200 && httpStatus < 300) || httpStatus == 409) {
		res.status = DeliveryStatus::Delivered;
		if (httpStatus == 409) res.message = QStringLiteral("already recorded");
		return res;
	}

	if (httpStatus >= 400 && httpStatus < 500 && httpStatus != 408 && httpStatus != 429) {
		res.status = DeliveryStatus::Rejected;
		const QJsonDocument doc = QJsonDocument::fromJson(body);
		const QString detail = doc.isObject() ? doc.object().value(QStringLiteral("detail")).toString() : QString();
		res.message = detail.isEmpty() ? QStringLiteral("HTTP %1").arg(httpStatus) : detail;
		return res;
	}

	res.status = DeliveryStatus::Transient;
	res.message = QStringLiteral("HTTP %1").arg(httpStatus);
	return res;
}

DeliveryResult HttpBackendClient::postAttendance(const AttendanceEvent& e)
{
	const QByteArray payload = QJsonDocument(toJson(e)).toJson(QJsonDocument::Compact);
	QNetworkReply* reply = nam()->post(makeRequest(QStringLiteral("/attendance"), params_.timeoutMs), payload);
	const Reply r = waitFor(reply);

	const DeliveryResult res = classify(r.httpStatus, r.transportError, r.errorString, r.body);
	qCDebug(LC_NET) << "[postAttendance]" << e.eventId << "status=" << r.httpStatus << res.message;
	return res;
}

bool HttpBackendClient::checkHealth()
{
	QNetworkReply* reply = nam()->get(makeRequest(QStringLiteral("/health"), params_.healthTimeoutMs));
	const Reply r = waitFor(reply);

	const bool ok = !r.transportError && r.httpStatus >= 200 && r.httpStatus < 300;
	if (!ok)
		qCDebug(LC_NET) << "[checkHealth] unreachable:" << (r.transportError ? r.errorString : QString::number(r.httpStatus));
	return ok;
}
