#pragma once

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace fr {
    // Applies one redaction to one clipped region of a frame, in place.
    class RegionRedactor {
    public:
        explicit RegionRedactor(RedactOptions opt);

        // index is 0-based; the annotation label shows index + 1.
        void apply(cv::Mat& frame, const RedactionRegion& region, int index, float score) const;

    private:
        void apply_solid_(cv::Mat& roi) const;
        void apply_blur_(cv::Mat& roi) const;
        void apply_pixelate_(cv::Mat& roi) const;
        void commit_(cv::Mat& roi, const cv::Mat& processed) const;
        void annotate_(cv::Mat& frame, const RedactionRegion& region, int index, float score) const;

        RedactOptions opt_;
    };
}
