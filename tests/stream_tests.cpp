#include <common/errors.hpp>
#include <pipeline/progress.hpp>
#include <pipeline/stream_processor.hpp>

#include "fakes.hpp"
#include "test_support.hpp"

#include <atomic>
#include <sstream>
#include <string>

using fr_test::check;

namespace {
    const std::string kCursorUp = "\x1b[A";

    fr::StreamJob video_job() {
        fr::StreamJob job;
        job.kind = fr::SourceKind::VideoFile;
        job.input = "/tmp/clip.mp4";
        job.output = "/tmp/clip_anonymized.mp4";
        job.redact.mode = fr::RedactMode::Solid;
        return job;
    }

    void test_video_runs_to_end() {
        fr_test::FakeDetector det;
        fr_test::FakeBackend media;
        media.frames = 7;
        std::ostringstream progress;
        std::atomic<bool> running(true);
        fr::StreamProcessor proc(det, media, progress, running);

        fr::StreamJob job = video_job();
        job.nested = true;
        const fr::StreamResult res = proc.run(job);

        check(res.frames == 7, "every frame of a finite video should be processed");
        check(!res.stopped_early, "a video that reaches its end is not stopped early");
        check(det.calls == 7, "the detector should run once per frame");
        check(media.sinks.size() == 1 && media.sinks[0]->written == 7, "every frame should be written");
        check(media.sinks[0]->opened == 1 && media.sinks[0]->closed == 1, "sink should be opened and closed once");
        check(media.sources.size() == 1 && media.sources[0]->closed >= 1, "source should be closed");
        check(media.previews == 0, "no preview window unless requested");
        check(progress.str().find("7/7") != std::string::npos, "a video with a known length shows count/total");
        check(progress.str().find(kCursorUp) != std::string::npos, "nested jobs draw below the current line");
    }

    void test_top_level_video_progress() {
        fr_test::FakeDetector det;
        fr_test::FakeBackend media;
        media.frames = 3;
        std::ostringstream progress;
        std::atomic<bool> running(true);
        fr::StreamProcessor proc(det, media, progress, running);

        fr::StreamJob job = video_job();
        job.nested = false;
        (void)proc.run(job);

        const std::string out = progress.str();
        check(out.find("3/3") != std::string::npos, "top-level bar should show count/total");
        check(out.find(kCursorUp) == std::string::npos, "top-level bars stay on the current line");
        check(!out.empty() && out.back() == '\n', "a closed top-level bar stays visible");
    }

    void test_preview_quit_stops_camera() {
        fr_test::FakeDetector det;
        fr_test::FakeBackend media;
        media.on_show = [](int shown) { return shown < 5; };
        std::ostringstream progress;
        std::atomic<bool> running(true);
        fr::StreamProcessor proc(det, media, progress, running);

        fr::StreamJob job = video_job();
        job.kind = fr::SourceKind::Camera;
        job.input = "<video0>";
        job.preview = true;
        const fr::StreamResult res = proc.run(job);

        check(res.stopped_early, "quitting the preview should stop the stream early");
        check(res.frames == 5, "frames up to and including the quit frame are processed");
        check(media.sinks[0]->written == 5, "frames up to the quit should be written");
        check(media.sinks[0]->closed == 1, "sink should be finalized after a quit");
        check(media.sources[0]->closed >= 1, "camera should be released after a quit");
        check(progress.str().find("5it") != std::string::npos, "a camera has no length, progress is a plain counter");
        check(progress.str().find("%|") == std::string::npos, "a camera never draws a bounded bar");
    }

    void test_running_flag_stops_camera() {
        fr_test::FakeDetector det;
        fr_test::FakeBackend media;
        std::ostringstream progress;
        std::atomic<bool> running(true);
        media.on_show = [&running](int shown) {
            if (shown == 4) running = false;
            return true;
        };
        fr::StreamProcessor proc(det, media, progress, running);

        fr::StreamJob job = video_job();
        job.kind = fr::SourceKind::Camera;
        job.preview = true;
        const fr::StreamResult res = proc.run(job);

        check(res.stopped_early, "clearing the running flag should stop the stream");
        check(res.frames == 4, "no frame should be read after the running flag is cleared");
        check(media.sinks[0]->closed == 1, "sink should be finalized after an interrupt");
        check(media.sources[0]->closed >= 1, "camera should be released after an interrupt");
    }

    void test_threshold_is_passed_through() {
        fr_test::FakeDetector det;
        det.raw = {
            {2.0f, 2.0f, 12.0f, 12.0f, 0.1f},
            {20.0f, 2.0f, 30.0f, 12.0f, 0.3f},
            {40.0f, 2.0f, 50.0f, 12.0f, 0.9f},
        };
        fr_test::FakeBackend media;
        media.frames = 1;
        std::ostringstream progress;
        std::atomic<bool> running(true);
        fr::StreamProcessor proc(det, media, progress, running);

        fr::StreamJob job = video_job();
        job.threshold = 0.2f;
        job.redact.mask_scale = 1.0f;
        job.redact.ellipse = false;
        (void)proc.run(job);

        check(det.thresholds_seen.size() == 1 && det.thresholds_seen[0] == 0.2f,
              "job threshold should reach the detector unchanged");

        const cv::Mat& out = media.sinks[0]->last;
        check(!out.empty(), "the anonymized frame should reach the sink");
        if (out.empty()) return;
        const cv::Vec3b white(255, 255, 255);
        const cv::Vec3b black(0, 0, 0);
        check(out.at<cv::Vec3b>(5, 5) == white, "detection below the threshold should not be redacted");
        check(out.at<cv::Vec3b>(5, 25) == black, "detection with score 0.3 should be redacted");
        check(out.at<cv::Vec3b>(5, 45) == black, "detection with score 0.9 should be redacted");
    }

    void test_timeouts_are_retried() {
        fr_test::FakeDetector det;
        fr_test::FakeBackend media;
        media.frames = 6;
        media.timeout_every = 3;
        std::ostringstream progress;
        std::atomic<bool> running(true);
        fr::StreamProcessor proc(det, media, progress, running);

        const fr::StreamResult res = proc.run(video_job());
        check(res.frames == 6, "read timeouts should not drop or end the stream");
    }

    void test_open_failure_creates_no_sink() {
        fr_test::FakeDetector det;
        fr_test::FakeBackend media;
        media.fail_open = true;
        std::ostringstream progress;
        std::atomic<bool> running(true);
        fr::StreamProcessor proc(det, media, progress, running);

        bool threw = false;
        try {
            (void)proc.run(video_job());
        } catch (const fr::SourceOpenError& e) {
            threw = e.reason() == fr::SourceOpenError::Reason::Unreadable;
        }
        check(threw, "an unopenable source should raise SourceOpenError");
        check(media.sinks.empty(), "no writer should be created for an unopenable source");
        check(det.calls == 0, "nothing should be detected for an unopenable source");
    }

    void test_write_error_releases_source() {
        fr_test::FakeDetector det;
        fr_test::FakeBackend media;
        media.frames = 10;
        media.fail_on_write = 3;
        std::ostringstream progress;
        std::atomic<bool> running(true);
        fr::StreamProcessor proc(det, media, progress, running);

        bool threw = false;
        try {
            (void)proc.run(video_job());
        } catch (const fr::WriteError&) {
            threw = true;
        }
        check(threw, "a failing write should propagate as WriteError");
        check(media.sinks[0]->written == 2, "frames before the failure should have been written");
        check(media.sinks[0]->closed == 1, "sink should still be closed after a write error");
        check(media.sources[0]->closed >= 1, "source should be closed after a write error");
    }

    void test_detection_error_releases_everything() {
        fr_test::FakeDetector det;
        det.throw_on_call = 2;
        fr_test::FakeBackend media;
        std::ostringstream progress;
        std::atomic<bool> running(true);
        fr::StreamProcessor proc(det, media, progress, running);

        bool threw = false;
        try {
            (void)proc.run(video_job());
        } catch (const fr::DetectionError&) {
            threw = true;
        }
        check(threw, "a detector failure should propagate as DetectionError");
        check(media.sinks[0]->closed == 1, "sink should be closed after a detector failure");
        check(media.sources[0]->closed >= 1, "source should be closed after a detector failure");
    }

    void test_image_job_without_output() {
        fr_test::FakeDetector det;
        fr_test::FakeBackend media;
        std::ostringstream progress;
        std::atomic<bool> running(true);
        fr::StreamProcessor proc(det, media, progress, running);

        fr::StreamJob job = video_job();
        job.kind = fr::SourceKind::Image;
        job.output.reset();
        const fr::StreamResult res = proc.run(job);

        check(res.frames == 1, "an image is a single frame");
        check(media.sinks.empty(), "no sink without an output path");
        check(progress.str().empty(), "images do not draw a progress bar");
    }

    void test_progress_bar_formatting() {
        std::ostringstream os;
        fr::ProgressBar bounded(os, int64_t{4}, fr::ProgressBar::Placement::TopLevel, "clip.mp4");
        bounded.update(2);
        const std::string line = bounded.format_line();
        check(line.find("2/4") != std::string::npos, "bounded bar should show count/total");
        check(line.find("clip.mp4") != std::string::npos, "bar should show its description");
        bounded.close();
        check(bounded.closed(), "close should mark the bar closed");

        std::ostringstream live;
        fr::ProgressBar unbounded(live, std::nullopt, fr::ProgressBar::Placement::Nested);
        unbounded.update(3);
        check(unbounded.count() == 3, "unbounded bar should count updates");
        check(!unbounded.total().has_value(), "unbounded bar has no total");
        check(unbounded.format_line().find("3it") != std::string::npos, "unbounded bar should show a plain counter");
        unbounded.close();
    }
}

int main() {
    test_video_runs_to_end();
    test_top_level_video_progress();
    test_preview_quit_stops_camera();
    test_running_flag_stops_camera();
    test_threshold_is_passed_through();
    test_timeouts_are_retried();
    test_open_failure_creates_no_sink();
    test_write_error_releases_source();
    test_detection_error_releases_everything();
    test_image_job_without_output();
    test_progress_bar_formatting();

    return fr_test::finish("stream");
}
