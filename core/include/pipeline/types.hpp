#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace fr {
    // One detector output item, frame pixel space.
    struct Detection {
        float x1 = 0.0f;
        float y1 = 0.0f;
        float x2 = 0.0f;
        float y2 = 0.0f;
        float score = 0.0f;
    };

    // Integer box before clipping. May be inverted or lie outside the frame.
    struct BoxI {
        int x1 = 0;
        int y1 = 0;
        int x2 = 0;
        int y2 = 0;
    };

    // Clipped box: 0 <= x1 <= x2 < width, 0 <= y1 <= y2 < height.
    // Covers pixels [x1, x2) x [y1, y2).
    struct RedactionRegion {
        int x1 = 0;
        int y1 = 0;
        int x2 = 0;
        int y2 = 0;

        int width() const { return x2 - x1; }
        int height() const { return y2 - y1; }
        bool empty() const { return x2 <= x1 || y2 <= y1; }
        cv::Rect rect() const { return {x1, y1, width(), height()}; }
    };

    enum class RedactMode {
        Solid,
        Blur,
        Pixelate,
        None
    };

    struct RedactOptions {
        RedactMode mode = RedactMode::Blur;

        // Boxes are grown by (mask_scale - 1) of their size on each side.
        float mask_scale = 1.3f;
        bool ellipse = true;
        bool annotate = false;

        // Blur: box kernel = region size / blur_factor.
        int blur_factor = 2;

        // Pixelate: downscale ROI by this factor, then upsample with nearest-neighbor.
        int pixelation_divisor = 10;

        cv::Scalar color = cv::Scalar(0, 0, 0);
    };

    enum class SourceKind {
        Image,
        VideoFile,
        Camera
    };

    struct StreamJob {
        SourceKind kind = SourceKind::VideoFile;
        std::string input; // file path or camera device
        std::optional<std::string> output;

        float threshold = 0.2f;
        RedactOptions redact;

        bool preview = false;
        // Rendered as a non-persistent sub-line under a batch-level bar.
        bool nested = false;
    };

    struct StreamResult {
        int64_t frames = 0;
        bool stopped_early = false;
    };

    RedactMode redact_mode_from_str(const std::string& s);
    std::string to_string(RedactMode m);
    std::string to_string(SourceKind k);
}
