#include <common/media_type.hpp>
#include <encode/gst_video_sink.hpp>
#include <ingest/frame_source_factory.hpp>
#include <ingest/gst_frame_source.hpp>
#include <pipeline/batch_driver.hpp>

#include "fakes.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using fr_test::check;

namespace {
    namespace fs = std::filesystem;

    size_t count_occurrences(const std::string& text, const std::string& needle) {
        size_t n = 0;
        for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) ++n;
        return n;
    }

    void test_derive_output_path() {
        check(fr::derive_output_path("photo.jpg") == fs::path("photo_anonymized.jpg"),
              "suffix goes before the extension");
        check(fr::derive_output_path("/data/in/clip.mp4", "_x") == fs::path("/data/in/clip_x.mp4"),
              "output stays next to the input");
        check(fr::derive_output_path("/data/README") == fs::path("/data/README_anonymized"),
              "inputs without an extension just get the suffix");
    }

    void test_classify_by_extension() {
        check(fr::media_kind_from_extension("a/PHOTO.JPG") == fr::MediaKind::Image, "extension match ignores case");
        check(fr::media_kind_from_extension("clip.mkv") == fr::MediaKind::Video, "mkv is a video");
        check(fr::media_kind_from_extension("notes.txt") == fr::MediaKind::Unknown, "txt is neither");
        check(fr::media_kind_from_extension("noext") == fr::MediaKind::Unknown, "no extension is unknown");
    }

    void test_classify_by_header() {
        const fs::path dir = fr_test::make_temp_dir("fr_sniff");
        fr_test::write_file(dir / "snapshot", std::string("\x89PNG\r\n\x1A\n\0\0\0\x0DIHDR", 16));
        fr_test::write_file(dir / "recording", std::string("\0\0\0\x18" "ftypisom\0\0\x02\0", 16));
        fr_test::write_file(dir / "notes.txt", "just some words\n");
        fr_test::write_file(dir / "empty", "");

        check(fr::classify_media(dir / "snapshot") == fr::MediaKind::Image, "PNG magic should classify as image");
        check(fr::classify_media(dir / "recording") == fr::MediaKind::Video, "ftyp box should classify as video");
        check(fr::classify_media(dir / "notes.txt") == fr::MediaKind::Unknown, "text should be unknown");
        check(fr::classify_media(dir / "empty") == fr::MediaKind::Unknown, "empty file should be unknown");
        check(fr::classify_media(dir / "missing") == fr::MediaKind::Unknown, "missing file should be unknown");

        fs::remove_all(dir);
    }

    void test_discover_files() {
        const fs::path dir = fr_test::make_temp_dir("fr_discover");
        fs::create_directories(dir / "sub");
        fs::create_directories(dir / ".cache");
        fr_test::write_file(dir / "b.jpg", "x");
        fr_test::write_file(dir / "a.mp4", "x");
        fr_test::write_file(dir / "sub" / "c.jpg", "x");
        fr_test::write_file(dir / ".hidden.jpg", "x");
        fr_test::write_file(dir / ".cache" / "d.jpg", "x");
        fr_test::write_file(dir / "README", "x");

        const auto any = fr::discover_files(dir, "*");
        check(any.size() == 3, "'*' should take every visible file with an extension");
        check(std::is_sorted(any.begin(), any.end()), "discovered files should be sorted");

        const auto jpg = fr::discover_files(dir, "jpg");
        const auto dot_jpg = fr::discover_files(dir, ".jpg");
        check(jpg.size() == 2, "extension filter should recurse into subdirectories");
        check(jpg == dot_jpg, "filter should accept the extension with or without a dot");

        bool threw = false;
        try {
            (void)fr::discover_files(dir / "nope", "*");
        } catch (const fr::SourceOpenError&) {
            threw = true;
        }
        check(threw, "a missing directory should raise SourceOpenError");

        fs::remove_all(dir);
    }

    void test_batch_run_mixed_directory() {
        const fs::path dir = fr_test::make_temp_dir("fr_batch");
        fr_test::write_file(dir / "photo.jpg", "\xFF\xD8\xFF\xE0");
        fr_test::write_file(dir / "clip.mp4", std::string("\0\0\0\x18" "ftypisom", 12));
        fr_test::write_file(dir / "broken.mp4", "corrupt");
        fr_test::write_file(dir / "notes.txt", "hello");

        fr_test::FakeDetector det;
        fr_test::FakeBackend media;
        media.frames = 3;
        media.touch_outputs = true;
        media.broken_marker = "broken";
        std::ostringstream progress;
        std::ostringstream report;
        std::atomic<bool> running(true);
        fr::StreamProcessor proc(det, media, progress, running);
        fr::BatchDriver batch(proc, report);

        fr::StreamJob tmpl;
        tmpl.preview = true;
        const auto results = batch.run(dir, tmpl, fr::BatchConfig{});

        check(results.size() == 4, "every discovered file should be attempted");
        size_t done = 0, skipped = 0, failed = 0;
        for (const auto& r : results) {
            if (r.status == fr::BatchItemResult::Status::Done) ++done;
            if (r.status == fr::BatchItemResult::Status::Skipped) ++skipped;
            if (r.status == fr::BatchItemResult::Status::Failed) ++failed;
        }
        check(done == 2, "image and video should be anonymized");
        check(skipped == 1, "the text file should be skipped");
        check(failed == 1, "the corrupt video should fail without aborting the batch");

        check(fs::exists(dir / "photo_anonymized.jpg"), "image output should be written next to the input");
        check(fs::exists(dir / "clip_anonymized.mp4"), "video output should be written next to the input");
        check(!fs::exists(dir / "broken_anonymized.mp4"), "no output for a file that failed to open");
        check(media.previews == 0, "batch items never open a preview");
        check(count_occurrences(report.str(), "Skipping...") == 2, "both non-processed files should be reported");
        check(report.str().find("2/4") != std::string::npos, "summary should count finished files");

        size_t outputs = 0;
        for (const auto& e : fs::directory_iterator(dir)) {
            if (e.path().filename().string().find("_anonymized") != std::string::npos) ++outputs;
        }
        check(outputs == 2, "exactly two outputs should be created");

        fs::remove_all(dir);
    }

    void test_batch_stops_when_interrupted() {
        const fs::path dir = fr_test::make_temp_dir("fr_batch_stop");
        fr_test::write_file(dir / "a.jpg", "x");
        fr_test::write_file(dir / "b.jpg", "x");

        fr_test::FakeDetector det;
        fr_test::FakeBackend media;
        std::ostringstream progress;
        std::ostringstream report;
        std::atomic<bool> running(false);
        fr::StreamProcessor proc(det, media, progress, running);
        fr::BatchDriver batch(proc, report);

        const auto results = batch.run(dir, fr::StreamJob{}, fr::BatchConfig{});
        check(results.empty(), "no item should start once the run was interrupted");
        check(media.sources.empty(), "no source should be opened after an interrupt");

        fs::remove_all(dir);
    }

    void test_camera_inputs() {
        check(fr::is_camera_input("<video0>"), "<video0> names a camera");
        check(fr::is_camera_input("/dev/video2"), "/dev/videoN names a camera");
        check(!fr::is_camera_input("<videoX>"), "device index must be numeric");
        check(!fr::is_camera_input("video0.mp4"), "a file is not a camera");
        check(fr::camera_device("<video1>") == "/dev/video1", "<videoN> maps to /dev/videoN");
        check(fr::camera_device("/dev/video3") == "/dev/video3", "device paths pass through");
    }

    void test_file_source_uses_configured_fps() {
        const fs::path dir = fr_test::make_temp_dir("fr_factory");
        fr_test::write_file(dir / "clip.mp4", "x");

        fr::StreamJob job;
        job.kind = fr::SourceKind::VideoFile;
        job.input = (dir / "clip.mp4").string();
        fr::CameraConfig cam;
        cam.fps = 12;

        const auto src = fr::make_frame_source(job, cam);
        const auto* gst = dynamic_cast<const fr::GstFrameSource*>(src.get());
        check(gst != nullptr, "video files should be read through GStreamer");
        if (gst) check(gst->fallback_fps() == 12.0, "files without a framerate should fall back to the configured fps");

        job.input = (dir / "missing.mp4").string();
        bool not_found = false;
        try {
            (void)fr::make_frame_source(job, cam);
        } catch (const fr::SourceOpenError& e) {
            not_found = e.reason() == fr::SourceOpenError::Reason::NotFound;
        }
        check(not_found, "a missing video file should be reported as not found");

        fs::remove_all(dir);
    }

    void test_container_for_output() {
        check(fr::GstVideoSink::muxer_for("out.mp4") == "mp4mux", "mp4 output uses mp4mux");
        check(fr::GstVideoSink::muxer_for("out.MKV") == "matroskamux", "mkv output uses matroskamux");
        check(fr::GstVideoSink::muxer_for("out.avi") == "avimux", "avi output uses avimux");
    }
}

int main() {
    test_derive_output_path();
    test_classify_by_extension();
    test_classify_by_header();
    test_discover_files();
    test_batch_run_mixed_directory();
    test_batch_stops_when_interrupted();
    test_camera_inputs();
    test_file_source_uses_configured_fps();
    test_container_for_output();

    return fr_test::finish("batch");
}
