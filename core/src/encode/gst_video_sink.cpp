#include <encode/gst_video_sink.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsrc.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <mutex>

#include <common/errors.hpp>

namespace fr {
    namespace {
        constexpr GstClockTime kFinalizeTimeout = 60 * GST_SECOND;

        std::string lower_ext(const std::string& path) {
            std::string ext = std::filesystem::path(path).extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return ext;
        }
    } // namespace

    GstVideoSink::GstVideoSink(std::string path) : path_(std::move(path)) {}

    GstVideoSink::~GstVideoSink() {
        try {
            close();
        } catch (const std::exception& e) {
            std::cerr << "[VideoSink](~) " << e.what() << "\n";
        }
    }

    std::string GstVideoSink::muxer_for(const std::string& path) {
        const std::string ext = lower_ext(path);
        if (ext == ".mkv" || ext == ".webm") return "matroskamux";
        if (ext == ".avi") return "avimux";
        if (ext == ".mov") return "qtmux";
        if (ext == ".ts" || ext == ".mts") return "mpegtsmux";
        return "mp4mux";
    }

    void GstVideoSink::open(const SourceInfo& info) {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        if (pipeline_) return;
        if (info.width <= 0 || info.height <= 0 || info.fps <= 0.0) {
            throw WriteError("[VideoSink] invalid stream geometry for " + path_);
        }

        width_ = info.width;
        height_ = info.height;
        gst_util_double_to_fraction(info.fps, &fps_n_, &fps_d_);
        frames_ = 0;

        const std::string pipeline_desc =
            "appsrc name=src format=time is-live=false block=true "
            "! videoconvert ! video/x-raw,format=I420 "
            "! x264enc speed-preset=medium "
            "! video/x-h264,profile=high "
            "! h264parse "
            "! " + muxer_for(path_) + " "
            "! filesink location=\"" + path_ + "\"";

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(pipeline_desc.c_str(), &err);
        if (!pipeline_) {
            std::string msg = "[VideoSink] Failed to create pipeline for " + path_;
            if (err) {
                msg += ": ";
                msg += err->message;
                g_error_free(err);
            }
            throw WriteError(msg);
        }
        if (err) g_error_free(err);

        appsrc_ = gst_bin_get_by_name(GST_BIN(pipeline_), "src");
        if (!appsrc_) {
            teardown_();
            throw WriteError("[VideoSink] Missing appsrc.");
        }

        GstCaps* caps = gst_caps_new_simple(
            "video/x-raw",
            "format", G_TYPE_STRING, "BGR",
            "width", G_TYPE_INT, width_,
            "height", G_TYPE_INT, height_,
            "framerate", GST_TYPE_FRACTION, fps_n_, fps_d_,
            nullptr);
        gst_app_src_set_caps(GST_APP_SRC(appsrc_), caps);
        gst_caps_unref(caps);

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            const std::string bus_err = pop_bus_error_();
            teardown_();
            throw WriteError("[VideoSink] cannot start writer for " + path_ + ": " + bus_err);
        }
    }

    void GstVideoSink::write(const cv::Mat& frame) {
        if (!appsrc_) {
            throw WriteError("[VideoSink] write to closed sink " + path_);
        }
        if (frame.empty() || frame.type() != CV_8UC3 || frame.cols != width_ || frame.rows != height_) {
            throw WriteError("[VideoSink] frame does not match stream geometry for " + path_);
        }

        const cv::Mat bgr = frame.isContinuous() ? frame : frame.clone();
        const size_t size = bgr.total() * bgr.elemSize();
        GstBuffer* buf = gst_buffer_new_allocate(nullptr, size, nullptr);

        GstMapInfo map;
        if (!gst_buffer_map(buf, &map, GST_MAP_WRITE)) {
            gst_buffer_unref(buf);
            throw WriteError("[VideoSink] cannot map buffer for " + path_);
        }
        std::memcpy(map.data, bgr.data, size);
        gst_buffer_unmap(buf, &map);

        GST_BUFFER_PTS(buf) = gst_util_uint64_scale(static_cast<guint64>(frames_),
                                                    static_cast<guint64>(fps_d_) * GST_SECOND,
                                                    static_cast<guint64>(fps_n_));
        GST_BUFFER_DURATION(buf) = gst_util_uint64_scale(GST_SECOND,
                                                         static_cast<guint64>(fps_d_),
                                                         static_cast<guint64>(fps_n_));

        GstFlowReturn ret = gst_app_src_push_buffer(GST_APP_SRC(appsrc_), buf);
        if (ret != GST_FLOW_OK) {
            const std::string bus_err = pop_bus_error_();
            throw WriteError("[VideoSink] Failed to push frame " + std::to_string(frames_) +
                             " to " + path_ + ". ret: " + std::to_string(ret) +
                             (bus_err.empty() ? "" : " (" + bus_err + ")"));
        }
        ++frames_;
    }

    void GstVideoSink::close() {
        if (!pipeline_) return;

        std::string failure;
        if (appsrc_) {
            gst_app_src_end_of_stream(GST_APP_SRC(appsrc_));

            GstBus* bus = gst_element_get_bus(pipeline_);
            GstMessage* msg = gst_bus_timed_pop_filtered(
                bus, kFinalizeTimeout, static_cast<GstMessageType>(GST_MESSAGE_EOS | GST_MESSAGE_ERROR));
            if (!msg) {
                failure = "timed out finalizing " + path_;
            } else {
                if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
                    GError* err = nullptr;
                    gchar* dbg = nullptr;
                    gst_message_parse_error(msg, &err, &dbg);
                    failure = "finalizing " + path_ + " failed: " + (err ? err->message : "unk error");
                    if (err) g_error_free(err);
                    if (dbg) g_free(dbg);
                }
                gst_message_unref(msg);
            }
            gst_object_unref(bus);
        }

        teardown_();
        if (!failure.empty()) throw WriteError("[VideoSink] " + failure);
    }

    void GstVideoSink::teardown_() {
        if (appsrc_) {
            gst_object_unref(appsrc_);
            appsrc_ = nullptr;
        }
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }

    std::string GstVideoSink::pop_bus_error_() const {
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
}
