#pragma once

#include <string>

#include <ingest/frame_source.hpp>

namespace fr {
    // A still image as a one-frame sequence.
    class ImageSource : public IFrameSource {
    public:
        explicit ImageSource(std::string path);

        void open() override;
        ReadStatus read(FramePacket& out, int timeout_ms) override;
        void close() override;

        const SourceInfo& info() const override { return info_; }

    private:
        std::string path_;
        SourceInfo info_;
        cv::Mat image_;
        bool consumed_ = false;
    };
}
