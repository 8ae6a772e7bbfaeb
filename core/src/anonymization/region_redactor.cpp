#include <anonymization/region_redactor.hpp>

#include <algorithm>

#include <opencv2/imgproc.hpp>

namespace fr {
    namespace {
        const cv::Scalar kLabelColor(128, 255, 128);
        constexpr int kLabelOffsetY = 20;
    } // namespace

    RegionRedactor::RegionRedactor(RedactOptions opt) : opt_(std::move(opt)) {
        opt_.blur_factor = std::max(1, opt_.blur_factor);
        opt_.pixelation_divisor = std::max(2, opt_.pixelation_divisor);
    }

    void RegionRedactor::apply(cv::Mat& frame, const RedactionRegion& region, int index, float score) const {
        if (frame.empty() || region.empty()) return;

        const cv::Rect roi_rect = region.rect() & cv::Rect(0, 0, frame.cols, frame.rows);
        if (roi_rect.area() <= 0) return;

        cv::Mat roi = frame(roi_rect);
        switch (opt_.mode) {
            case RedactMode::Solid:
                apply_solid_(roi);
                break;
            case RedactMode::Blur:
                apply_blur_(roi);
                break;
            case RedactMode::Pixelate:
                apply_pixelate_(roi);
                break;
            case RedactMode::None:
                break;
        }

        if (opt_.annotate) annotate_(frame, region, index, score);
    }

    void RegionRedactor::apply_solid_(cv::Mat& roi) const {
        roi.setTo(opt_.color);
    }

    void RegionRedactor::apply_blur_(cv::Mat& roi) const {
        const int kw = std::max(1, roi.cols / opt_.blur_factor);
        const int kh = std::max(1, roi.rows / opt_.blur_factor);
        cv::Mat blurred;
        cv::blur(roi, blurred, cv::Size(kw, kh));
        commit_(roi, blurred);
    }

    void RegionRedactor::apply_pixelate_(cv::Mat& roi) const {
        cv::Mat tiny;
        const int tw = std::max(1, roi.cols / opt_.pixelation_divisor);
        const int th = std::max(1, roi.rows / opt_.pixelation_divisor);
        cv::resize(roi, tiny, cv::Size(tw, th), 0, 0, cv::INTER_LINEAR);
        cv::Mat blocky;
        cv::resize(tiny, blocky, roi.size(), 0, 0, cv::INTER_NEAREST);
        commit_(roi, blocky);
    }

    void RegionRedactor::commit_(cv::Mat& roi, const cv::Mat& processed) const {
        if (!opt_.ellipse) {
            processed.copyTo(roi);
            return;
        }

        // Inscribed ellipse; pixels outside it keep their original values.
        cv::Mat mask = cv::Mat::zeros(roi.size(), CV_8UC1);
        const cv::Point center(roi.cols / 2, roi.rows / 2);
        const cv::Size axes(roi.cols / 2, roi.rows / 2);
        cv::ellipse(mask, center, axes, 0.0, 0.0, 360.0, cv::Scalar(255), cv::FILLED);
        processed.copyTo(roi, mask);
    }

    void RegionRedactor::annotate_(cv::Mat& frame, const RedactionRegion& region, int index, float score) const {
        const std::string label = cv::format("%d: %.2f", index + 1, score);
        cv::putText(frame,
                    label,
                    cv::Point(region.x1, region.y1 - kLabelOffsetY),
                    cv::FONT_HERSHEY_SIMPLEX,
                    1.0,
                    kLabelColor);
    }
}
