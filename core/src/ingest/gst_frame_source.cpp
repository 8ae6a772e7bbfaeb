#include <ingest/gst_frame_source.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <opencv2/core.hpp>

#include <cmath>
#include <iostream>
#include <mutex>

#include <common/errors.hpp>

namespace fr {
    namespace {
        constexpr GstClockTime kOpenTimeout = 10 * GST_SECOND;
    } // namespace

    GstFrameSource::GstFrameSource(std::string pipeline, std::string id, std::string sink_name, bool live)
        : pipeline_str_(std::move(pipeline)),
          id_(std::move(id)),
          sink_name_(std::move(sink_name)),
          live_(live) {}

    void GstFrameSource::open() {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        using Reason = SourceOpenError::Reason;
        auto fail = [this](Reason reason, const std::string& detail) {
            close();
            throw SourceOpenError(reason, id_, detail);
        };

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(pipeline_str_.c_str(), &err);
        if (!pipeline_ || err) {
            std::string msg = "parse_launch failed (unk error)";
            if (err) {
                msg = std::string("parse_launch error: ") + err->message;
                g_error_free(err);
            }
            fail(Reason::Unreadable, msg);
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!sink_) {
            fail(Reason::Unreadable, "appsink named " + sink_name_ + " not found");
        }

        // Files must not lose frames; cameras keep only the freshest ones.
        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_drop(appsink, live_ ? TRUE : FALSE);
        gst_app_sink_set_max_buffers(appsink, live_ ? 2 : 4);
        gst_app_sink_set_emit_signals(appsink, FALSE);

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            fail(Reason::Unreadable, pop_bus_error_());
        }
        if (gst_element_get_state(pipeline_, nullptr, nullptr, kOpenTimeout) == GST_STATE_CHANGE_FAILURE) {
            fail(Reason::Unreadable, pop_bus_error_());
        }

        // The first sample carries the negotiated caps.
        GstSample* sample = gst_app_sink_try_pull_sample(appsink, kOpenTimeout);
        if (!sample) {
            if (gst_app_sink_is_eos(appsink)) {
                fail(Reason::MissingMetadata, "stream has no video frames");
            }
            const std::string bus_err = pop_bus_error_();
            if (!bus_err.empty()) fail(Reason::Unreadable, bus_err);
            fail(Reason::MissingMetadata, "timed out waiting for the first frame");
        }

        GstCaps* caps = gst_sample_get_caps(sample);
        int num = 0, den = 0;
        if (caps) {
            GstStructure* st = gst_caps_get_structure(caps, 0);
            gst_structure_get_int(st, "width", &info_.width);
            gst_structure_get_int(st, "height", &info_.height);
            gst_structure_get_fraction(st, "framerate", &num, &den);
        }

        const bool ok = sample_to_packet_(sample, pending_);
        gst_sample_unref(sample);
        if (!ok || info_.width <= 0 || info_.height <= 0) {
            fail(Reason::MissingMetadata, "frame size unavailable");
        }
        has_pending_ = true;

        if (num > 0 && den > 0) {
            info_.fps = static_cast<double>(num) / static_cast<double>(den);
        } else {
            std::cerr << "[GStreamer](open) " << id_ << ": no framerate in caps, assuming " << fallback_fps_ << "\n";
            info_.fps = fallback_fps_;
        }

        info_.frame_count.reset();
        if (!live_) {
            gint64 duration_ns = 0;
            if (gst_element_query_duration(pipeline_, GST_FORMAT_TIME, &duration_ns) && duration_ns > 0) {
                const double seconds = static_cast<double>(duration_ns) / static_cast<double>(GST_SECOND);
                info_.frame_count = static_cast<int64_t>(std::llround(seconds * info_.fps));
            }
        }
    }

    ReadStatus GstFrameSource::read(FramePacket& out, int timeout_ms) {
        if (has_pending_) {
            out = std::move(pending_);
            pending_ = FramePacket{};
            has_pending_ = false;
            return ReadStatus::Frame;
        }
        if (!sink_) return ReadStatus::End;

        GstAppSink* appsink = GST_APP_SINK(sink_);
        GstSample* sample = gst_app_sink_try_pull_sample(
            appsink, static_cast<GstClockTime>(timeout_ms) * GST_MSECOND);

        if (!sample) {
            if (gst_app_sink_is_eos(appsink)) return ReadStatus::End;
            const std::string bus_err = pop_bus_error_();
            if (!bus_err.empty()) {
                throw DecodeError("[GStreamer] " + id_ + ": " + bus_err);
            }
            return ReadStatus::Timeout;
        }

        const bool ok = sample_to_packet_(sample, out);
        gst_sample_unref(sample);
        if (!ok) {
            throw DecodeError("[GStreamer] " + id_ + ": malformed sample at frame " + std::to_string(frame_id_));
        }
        return ReadStatus::Frame;
    }

    bool GstFrameSource::sample_to_packet_(GstSample* sample, FramePacket& out) {
        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) return false;

        GstStructure* st = gst_caps_get_structure(caps, 0);
        int width = 0, height = 0;
        gst_structure_get_int(st, "width", &width);
        gst_structure_get_int(st, "height", &height);
        if (width <= 0 || height <= 0) return false;

        GstMapInfo map;
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ)) return false;
        if (!map.data || map.size == 0) {
            gst_buffer_unmap(buffer, &map);
            return false;
        }

        GstVideoInfo vinfo;
        int stride = width * 3;
        if (gst_video_info_from_caps(&vinfo, caps)) {
            int s0 = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
            if (s0 > 0) stride = s0;
        }

        const size_t min_bytes = static_cast<size_t>(stride) * static_cast<size_t>(height);
        if (map.size < min_bytes) {
            gst_buffer_unmap(buffer, &map);
            return false;
        }

        cv::Mat tmp(height, width, CV_8UC3, (void*)map.data, stride);
        out.bgr = tmp.clone();

        ++frame_id_;

        gst_buffer_unmap(buffer, &map);
        return true;
    }

    std::string GstFrameSource::pop_bus_error_() const {
        if (!pipeline_) return {};
        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return {};

        std::string out;
        GstMessage* msg = gst_bus_pop_filtered(bus, GST_MESSAGE_ERROR);
        if (msg) {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &err, &dbg);
            if (err) {
                out = err->message;
                g_error_free(err);
            }
            if (dbg) g_free(dbg);
            gst_message_unref(msg);
        }
        gst_object_unref(bus);
        return out;
    }

    void GstFrameSource::close() {
        has_pending_ = false;
        pending_ = FramePacket{};
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (sink_) {
                gst_object_unref(sink_);
                sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }

    GstFrameSource::~GstFrameSource() {
        close();
    }
}
