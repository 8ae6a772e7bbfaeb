#pragma once

#include <encode/frame_sink.hpp>

namespace fr {
    class ImageSink : public IFrameSink {
    public:
        explicit ImageSink(std::string path);

        void open(const SourceInfo& info) override;
        void write(const cv::Mat& bgr) override;
        void close() override {}

        const std::string& path() const override { return path_; }

    private:
        std::string path_;
    };
}
