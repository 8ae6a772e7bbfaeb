#pragma once

#include <algorithm>
#include <cmath>
#include <limits>

#include <pipeline/types.hpp>

namespace fr {
    // Saturating double -> int; NaN maps to 0.
    inline int saturate_to_int(double v) {
        if (std::isnan(v)) return 0;
        constexpr double lo = static_cast<double>(std::numeric_limits<int>::min());
        constexpr double hi = static_cast<double>(std::numeric_limits<int>::max());
        return static_cast<int>(std::clamp(v, lo, hi));
    }

    // Grows (m > 1) or shrinks (m < 1) a box about its own center by (m - 1)
    // times its size on every side. Rounds half to even, saturates at the
    // int range. No clamping to the frame.
    inline BoxI scale_box(int x1, int y1, int x2, int y2, double mask_scale = 1.0) {
        const double s = mask_scale - 1.0;
        const double h = static_cast<double>(y2) - static_cast<double>(y1);
        const double w = static_cast<double>(x2) - static_cast<double>(x1);

        BoxI out;
        out.x1 = saturate_to_int(std::nearbyint(x1 - w * s));
        out.y1 = saturate_to_int(std::nearbyint(y1 - h * s));
        out.x2 = saturate_to_int(std::nearbyint(x2 + w * s));
        out.y2 = saturate_to_int(std::nearbyint(y2 + h * s));
        return out;
    }

    inline BoxI scale_box(const BoxI& b, double mask_scale = 1.0) {
        return scale_box(b.x1, b.y1, b.x2, b.y2, mask_scale);
    }

    // Inverted boxes collapse to zero area at x1/y1.
    inline RedactionRegion clip_to_frame(const BoxI& b, int frame_w, int frame_h) {
        RedactionRegion r;
        if (frame_w <= 0 || frame_h <= 0) return r;

        r.x1 = std::clamp(b.x1, 0, frame_w - 1);
        r.x2 = std::clamp(b.x2, 0, frame_w - 1);
        r.y1 = std::clamp(b.y1, 0, frame_h - 1);
        r.y2 = std::clamp(b.y2, 0, frame_h - 1);

        if (r.x2 < r.x1) r.x2 = r.x1;
        if (r.y2 < r.y1) r.y2 = r.y1;
        return r;
    }
}
