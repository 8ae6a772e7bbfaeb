#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace fr {
    class IFaceDetector {
    public:
        virtual ~IFaceDetector() = default;

        // Returns detections with score >= threshold, in the detector's own order.
        virtual std::vector<Detection> detect(const cv::Mat& bgr, float threshold) = 0;
    };
}
