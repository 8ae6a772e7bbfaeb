#pragma once

#include <ingest/frame_source.hpp>
#include <string>

struct _GstElement;
using GstElement = _GstElement;
struct _GstSample;
using GstSample = _GstSample;

namespace fr {
    // appsink-backed source for video files (finite) and cameras (live).
    class GstFrameSource: public IFrameSource {
    public:
        GstFrameSource(std::string pipeline, std::string src_id, std::string sink_name, bool live);

        void open() override;
        ReadStatus read(FramePacket& out, int timeout_ms = 1000) override;
        void close() override;

        const SourceInfo& info() const override { return info_; }

        // Used when the caps carry no framerate.
        void set_fallback_fps(double fps) { fallback_fps_ = fps; }
        double fallback_fps() const { return fallback_fps_; }

        ~GstFrameSource() override;

    private:
        bool sample_to_packet_(GstSample* sample, FramePacket& out);
        std::string pop_bus_error_() const;

        std::string pipeline_str_;
        std::string id_;
        std::string sink_name_;
        bool live_ = false;
        double fallback_fps_ = 30.0;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;

        SourceInfo info_;
        FramePacket pending_;
        bool has_pending_ = false;
        int64_t frame_id_ = 0;
    };
}
