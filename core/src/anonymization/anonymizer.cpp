#include <anonymization/anonymizer.hpp>

#include <cmath>

#include <anonymization/bbox.hpp>

namespace fr {
    Anonymizer::Anonymizer(RedactOptions opt)
        : redactor_(opt),
          mask_scale_(static_cast<double>(opt.mask_scale)) {}

    void Anonymizer::apply(cv::Mat& frame, const std::vector<Detection>& detections) const {
        if (frame.empty()) return;

        for (size_t i = 0; i < detections.size(); ++i) {
            const Detection& d = detections[i];
            const RedactionRegion region = map_detection_(d, frame.cols, frame.rows);
            redactor_.apply(frame, region, static_cast<int>(i), d.score);
        }
    }

    RedactionRegion Anonymizer::map_detection_(const Detection& d, int frame_w, int frame_h) const {
        const BoxI scaled = scale_box(saturate_to_int(std::trunc(d.x1)),
                                      saturate_to_int(std::trunc(d.y1)),
                                      saturate_to_int(std::trunc(d.x2)),
                                      saturate_to_int(std::trunc(d.y2)),
                                      mask_scale_);
        return clip_to_frame(scaled, frame_w, frame_h);
    }
}
