#pragma once
#include <vector>
#include <opencv2/core.hpp>
#include "include/types.hpp"

// Detection + tracking + gallery match, one synchronous call per frame.
// Malformed output is reported by throwing VisionInputError.
class IVisionProvider {
public:
	virtual ~IVisionProvider() = default;

	virtual std::vector<FaceDetection> detect(const cv::Mat& frame, qint64 capturedAtMs) = 0;

	// false once a finite source has nothing more to give
	virtual bool hasMore() const { return true; }
};
