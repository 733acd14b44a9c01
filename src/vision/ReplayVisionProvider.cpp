#include "vision/ReplayVisionProvider.hpp"
#include "include/errors.hpp"
#include "log/log_categories.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

bool ReplayVisionProvider::open(const QString& path)
{
	QFile f(path);
	if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
		qCWarning(LC_PIPELINE) << "[ReplayVisionProvider] cannot open" << path << f.errorString();
		return false;
	}

	QList<QByteArray> lines;
	while (!f.atEnd()) {
		const QByteArray line = f.readLine().trimmed();
		if (line.isEmpty() || line.startsWith('#')) continue;
		lines << line;
	}
	setLines(lines);
	qCInfo(LC_PIPELINE) << "[ReplayVisionProvider]" << lines_.size() << "frame(s) from" << path;
	return true;
}

void ReplayVisionProvider::setLines(const QList<QByteArray>& lines)
{
	lines_ = lines;
	pos_ = 0;
}

std::vector<FaceDetection> ReplayVisionProvider::detect(const cv::Mat& /*frame*/, qint64 /*capturedAtMs*/)
{
	if (lines_.isEmpty()) return {};
	if (pos_ >= lines_.size()) {
		if (!loop_) return {};
		pos_ = 0;
	}
	// advance first so a bad line is skipped, not replayed forever
	return parseLine(lines_.at(pos_++));
}

std::vector<FaceDetection> ReplayVisionProvider::parseLine(const QByteArray& line)
{
	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(line, &perr);
	if (perr.error != QJsonParseError::NoError || !doc.isObject())
		throw VisionInputError(QStringLiteral("unparsable detection line: %1").arg(perr.errorString()));

	const QJsonValue faces = doc.object().value(QStringLiteral("faces"));
	if (!faces.isArray())
		throw VisionInputError(QStringLiteral("detection line without 'faces' array"));

	std::vector<FaceDetection> out;
	for (const QJsonValue& v : faces.toArray()) {
		if (!v.isObject()) throw VisionInputError(QStringLiteral("face entry is not an object"));
		const QJsonObject o = v.toObject();

		FaceDetection d;
		d.trackId = o.value(QStringLiteral("track")).toString();
		if (d.trackId.isEmpty()) throw VisionInputError(QStringLiteral("face entry without track"));

		const QJsonArray bb = o.value(QStringLiteral("bbox")).toArray();
		if (bb.size() == 4)
			d.box = cv::Rect(bb.at(0).toInt(), bb.at(1).toInt(), bb.at(2).toInt(), bb.at(3).toInt());

		const QJsonValue person = o.value(QStringLiteral("person"));
		if (person.isString() && !person.toString().isEmpty())
			d.personId = person.toString();

		const QJsonValue conf = o.value(QStringLiteral("conf"));
		if (!conf.isDouble()) throw VisionInputError(QStringLiteral("face %1 without numeric conf").arg(d.trackId));
		d.confidence = conf.toDouble();
		if (d.confidence < 0.0 || d.confidence > 1.0)
			throw VisionInputError(QStringLiteral("face %1 conf out of range").arg(d.trackId));

		out.push_back(d);
	}
	return out;
}
