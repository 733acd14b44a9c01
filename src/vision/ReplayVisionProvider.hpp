#pragma once
#include <QByteArray>
#include <QList>
#include <QString>
#include "vision/VisionProvider.hpp"

// Plays back recorded detections, one JSON line per frame:
// {"faces":[{"track":"t1","bbox":[x,y,w,h],"person":"P1","conf":0.9}]}
class ReplayVisionProvider final : public IVisionProvider {
public:
	ReplayVisionProvider() = default;

	// false when the file cannot be read
	bool open(const QString& path);
	void setLines(const QList<QByteArray>& lines);
	void setLoop(bool loop) { loop_ = loop; }

	std::vector<FaceDetection> detect(const cv::Mat& frame, qint64 capturedAtMs) override;
	bool hasMore() const override { return loop_ ? !lines_.isEmpty() : pos_ < lines_.size(); }

	// Throws VisionInputError
	static std::vector<FaceDetection> parseLine(const QByteArray& line);

	int frameCount() const { return lines_.size(); }

private:
	QList<QByteArray> lines_;
	int pos_ = 0;
	bool loop_ = false;
};
