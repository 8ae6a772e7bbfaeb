#pragma once

#include <string>

#include <opencv2/core.hpp>

#include <ingest/frame_source.hpp>

namespace fr {
    struct IFrameSink {
        virtual ~IFrameSink() = default;

        // All three throw WriteError.
        virtual void open(const SourceInfo& info) = 0;
        virtual void write(const cv::Mat& bgr) = 0;
        // Flushes and finalizes. Idempotent.
        virtual void close() = 0;

        virtual const std::string& path() const = 0;
    };
}
