#include <common/cli.hpp>
#include <common/config.hpp>
#include <common/errors.hpp>
#include <common/media_type.hpp>
#include <inference/yunet_detector.hpp>
#include <ingest/frame_source_factory.hpp>
#include <pipeline/batch_driver.hpp>
#include <pipeline/media_backend.hpp>
#include <pipeline/stream_processor.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#ifndef FACEREDACT_VERSION
#define FACEREDACT_VERSION "unknown"
#endif

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

static fr::StreamJob base_job(const fr::AppConfig& cfg) {
    fr::StreamJob job;
    job.threshold = cfg.run.threshold;
    job.redact = cfg.redact;
    job.preview = cfg.run.preview;
    job.nested = false;
    return job;
}

static int run_single(fr::StreamProcessor& proc, fr::StreamJob job) {
    try {
        const fr::StreamResult res = proc.run(job);
        if (job.output) {
            std::cerr << "[facered] " << res.frames << " frame(s) written to " << *job.output
                      << (res.stopped_early ? " (stopped early)" : "") << "\n";
        }
        return 0;
    } catch (const fr::SourceOpenError& e) {
        if (e.reason() == fr::SourceOpenError::Reason::NoDevice) {
            std::cerr << "Could not find video device " << e.source() << ". Please set a valid input.\n";
        } else {
            std::cerr << "Could not open " << job.input << ": " << e.what() << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to anonymize " << job.input << ": " << e.what() << "\n";
    }
    return 1;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    namespace fs = std::filesystem;
    const std::string prog = argc > 0 ? fs::path(argv[0]).filename().string() : "facered";

    fr::CliArgs args;
    fr::AppConfig cfg;
    try {
        args = fr::parse_args(argc, argv);
        if (args.help) {
            std::cout << fr::usage(prog);
            return 0;
        }
        if (args.version) {
            std::cout << FACEREDACT_VERSION << "\n";
            return 0;
        }
        if (args.config_path) cfg = fr::load_config_yaml(*args.config_path);
        fr::apply_cli(args, cfg);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 2;
    } catch (const fr::ConfigError& e) {
        std::cerr << e.what() << "\n\n" << fr::usage(prog);
        return 2;
    }

    std::unique_ptr<fr::YuNetDetector> detector;
    try {
        detector = std::make_unique<fr::YuNetDetector>(cfg.detector);
    } catch (const std::exception& e) {
        std::cerr << "Detector init failed: " << e.what() << "\n";
        return 1;
    }

    fr::DefaultMediaBackend media(cfg.camera);
    fr::StreamProcessor proc(*detector, media, std::cerr, g_running);

    fr::StreamJob job = base_job(cfg);
    const std::string& ipath = args.input;

    if (fr::is_camera_input(ipath)) {
        job.kind = fr::SourceKind::Camera;
        job.input = ipath;
        job.output = args.output;
        return run_single(proc, job);
    }

    std::error_code ec;
    if (fs::is_regular_file(ipath, ec)) {
        const fr::MediaKind kind = fr::classify_media(ipath);
        if (kind == fr::MediaKind::Unknown) {
            std::cerr << fr::UnknownContentTypeError(ipath).what() << "\n";
            return 1;
        }
        job.kind = kind == fr::MediaKind::Video ? fr::SourceKind::VideoFile : fr::SourceKind::Image;
        job.input = ipath;
        job.output = args.output ? *args.output : fr::derive_output_path(ipath, cfg.batch.suffix).string();
        if (job.kind == fr::SourceKind::Image) job.preview = false;
        return run_single(proc, job);
    }

    if (fs::is_directory(ipath, ec)) {
        fr::BatchDriver batch(proc, std::cerr);
        try {
            batch.run(ipath, job, cfg.batch);
        } catch (const std::exception& e) {
            std::cerr << "Batch over " << ipath << " aborted: " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

    std::cerr << ipath << " not found.\n";
    return 1;
}
