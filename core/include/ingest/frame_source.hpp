#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace fr {
    struct FramePacket {
        cv::Mat bgr;
    };

    struct SourceInfo {
        int width = 0;
        int height = 0;
        double fps = 0.0;
        std::optional<int64_t> frame_count; // unset for live sources
    };

    enum class ReadStatus {
        Frame,
        Timeout, // nothing yet, try again
        End
    };

    // A lazy, finite or infinite, non-restartable sequence of frames.
    struct IFrameSource {
        virtual ~IFrameSource() = default;

        // Throws SourceOpenError.
        virtual void open() = 0;
        virtual ReadStatus read(FramePacket& out, int timeout_ms) = 0;
        // Idempotent, never throws.
        virtual void close() = 0;

        virtual const SourceInfo& info() const = 0;
    };
}
