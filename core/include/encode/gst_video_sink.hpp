#pragma once

#include <cstdint>
#include <string>

#include <encode/frame_sink.hpp>

struct _GstElement;
using GstElement = _GstElement;

namespace fr {
    // appsrc ! x264enc ! <mux> ! filesink. Mux follows the file extension.
    class GstVideoSink : public IFrameSink {
    public:
        explicit GstVideoSink(std::string path);
        ~GstVideoSink() override;

        GstVideoSink(const GstVideoSink&) = delete;
        GstVideoSink& operator=(const GstVideoSink&) = delete;

        void open(const SourceInfo& info) override;
        void write(const cv::Mat& bgr) override;
        void close() override;

        const std::string& path() const override { return path_; }

        static std::string muxer_for(const std::string& path);

    private:
        void teardown_();
        std::string pop_bus_error_() const;

        std::string path_;
        GstElement* pipeline_ = nullptr;
        GstElement* appsrc_ = nullptr;

        int width_ = 0;
        int height_ = 0;
        int fps_n_ = 0;
        int fps_d_ = 1;
        int64_t frames_ = 0;
    };
}
