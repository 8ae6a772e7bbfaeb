#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <common/errors.hpp>
#include <display/preview.hpp>
#include <encode/frame_sink.hpp>
#include <inference/face_detector.hpp>
#include <ingest/frame_source.hpp>
#include <pipeline/media_backend.hpp>

// In-memory collaborators for StreamProcessor and BatchDriver tests.
namespace fr_test {
    class FakeDetector : public fr::IFaceDetector {
    public:
        std::vector<fr::Detection> raw;
        std::vector<float> thresholds_seen;
        int calls = 0;
        int throw_on_call = -1; // 1-based

        std::vector<fr::Detection> detect(const cv::Mat&, float threshold) override {
            ++calls;
            thresholds_seen.push_back(threshold);
            if (calls == throw_on_call) {
                throw fr::DetectionError("fake detector failure");
            }
            std::vector<fr::Detection> out;
            for (const auto& d : raw) {
                if (d.score >= threshold) out.push_back(d);
            }
            return out;
        }
    };

    struct SourceState {
        int opened = 0;
        int closed = 0;
        int reads = 0;
    };

    struct SinkState {
        std::string path;
        int opened = 0;
        int closed = 0;
        int written = 0;
        cv::Mat last;
    };

    class FakeSource : public fr::IFrameSource {
    public:
        // frames < 0: endless.
        FakeSource(std::shared_ptr<SourceState> st, std::string id, int frames, int w, int h)
            : st_(std::move(st)),
              id_(std::move(id)),
              frames_(frames) {
            info_.width = w;
            info_.height = h;
            info_.fps = 25.0;
            if (frames >= 0) info_.frame_count = frames;
        }

        bool fail_open = false;
        int timeout_every = 0; // every n-th read times out

        void open() override {
            ++st_->opened;
            if (fail_open) {
                throw fr::SourceOpenError(fr::SourceOpenError::Reason::Unreadable, id_, "fake");
            }
        }

        fr::ReadStatus read(fr::FramePacket& out, int) override {
            ++st_->reads;
            if (timeout_every > 0 && st_->reads % timeout_every == 0) {
                return fr::ReadStatus::Timeout;
            }
            if (frames_ >= 0 && produced_ >= frames_) return fr::ReadStatus::End;

            out.bgr = cv::Mat(info_.height, info_.width, CV_8UC3, cv::Scalar(255, 255, 255));
            ++produced_;
            return fr::ReadStatus::Frame;
        }

        void close() override { ++st_->closed; }

        const fr::SourceInfo& info() const override { return info_; }

    private:
        std::shared_ptr<SourceState> st_;
        std::string id_;
        int frames_ = 0;
        int produced_ = 0;
        fr::SourceInfo info_;
    };

    class FakeSink : public fr::IFrameSink {
    public:
        explicit FakeSink(std::shared_ptr<SinkState> st) : st_(std::move(st)) {}

        int fail_on_write = -1; // 1-based
        bool touch_file = false;

        void open(const fr::SourceInfo&) override { ++st_->opened; }

        void write(const cv::Mat& bgr) override {
            if (st_->written + 1 == fail_on_write) {
                throw fr::WriteError("fake sink full: " + st_->path);
            }
            ++st_->written;
            bgr.copyTo(st_->last);
        }

        void close() override {
            if (closed_) return;
            closed_ = true;
            ++st_->closed;
            if (touch_file) {
                std::ofstream out(st_->path, std::ios::binary);
                out << "anonymized";
            }
        }

        const std::string& path() const override { return st_->path; }

    private:
        std::shared_ptr<SinkState> st_;
        bool closed_ = false;
    };

    class FakePreview : public fr::IPreview {
    public:
        explicit FakePreview(std::function<bool(int)> on_show) : on_show_(std::move(on_show)) {}

        bool show(const cv::Mat&) override { return on_show_(++shown_); }

    private:
        std::function<bool(int)> on_show_;
        int shown_ = 0;
    };

    // One SourceState/SinkState per created collaborator, kept after the
    // processor has released the objects themselves.
    class FakeBackend : public fr::IMediaBackend {
    public:
        int frames = 5;        // per video; images always yield one
        int width = 64;
        int height = 48;
        bool fail_open = false;
        int fail_on_write = -1;
        int timeout_every = 0;
        bool touch_outputs = false;
        std::function<bool(int)> on_show; // unset: preview never quits
        // Inputs whose name contains this fail to open.
        std::string broken_marker;

        std::vector<std::shared_ptr<SourceState>> sources;
        std::vector<std::shared_ptr<SinkState>> sinks;
        int previews = 0;

        std::unique_ptr<fr::IFrameSource> make_source(const fr::StreamJob& job) override {
            auto st = std::make_shared<SourceState>();
            sources.push_back(st);
            int n = frames;
            if (job.kind == fr::SourceKind::Image) n = 1;
            if (job.kind == fr::SourceKind::Camera) n = -1;
            auto src = std::make_unique<FakeSource>(st, job.input, n, width, height);
            src->fail_open = fail_open ||
                             (!broken_marker.empty() && job.input.find(broken_marker) != std::string::npos);
            src->timeout_every = timeout_every;
            return src;
        }

        std::unique_ptr<fr::IFrameSink> make_sink(const fr::StreamJob& job) override {
            auto st = std::make_shared<SinkState>();
            st->path = job.output ? *job.output : std::string();
            sinks.push_back(st);
            auto sink = std::make_unique<FakeSink>(st);
            sink->fail_on_write = fail_on_write;
            sink->touch_file = touch_outputs;
            return sink;
        }

        std::unique_ptr<fr::IPreview> make_preview(const fr::StreamJob&) override {
            ++previews;
            std::function<bool(int)> cb = on_show;
            if (!cb) cb = [](int) { return true; };
            return std::make_unique<FakePreview>(cb);
        }
    };
}
