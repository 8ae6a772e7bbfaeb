#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include <anonymization/region_redactor.hpp>
#include <pipeline/types.hpp>

namespace fr {
    class Anonymizer {
    public:
        explicit Anonymizer(RedactOptions opt);

        // Redacts every detection in the order given. Threshold filtering is
        // the detector's job; nothing is dropped here.
        void apply(cv::Mat& frame, const std::vector<Detection>& detections) const;

    private:
        RedactionRegion map_detection_(const Detection& d, int frame_w, int frame_h) const;

        RegionRedactor redactor_;
        double mask_scale_ = 1.0;
    };
}
