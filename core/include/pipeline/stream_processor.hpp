#pragma once

#include <atomic>
#include <ostream>

#include <inference/face_detector.hpp>
#include <pipeline/media_backend.hpp>
#include <pipeline/types.hpp>

namespace fr {
    // Drives one input item: open -> (read -> detect -> anonymize -> write
    // -> preview)* -> close. Source, sink, preview and progress bar are
    // released on every exit path; errors propagate after that.
    class StreamProcessor {
    public:
        struct Options {
            // Read timeout; the running flag is re-checked at least this often.
            int read_timeout_ms = 500;
        };

        StreamProcessor(IFaceDetector& detector,
                        IMediaBackend& media,
                        std::ostream& progress_out,
                        const std::atomic<bool>& running);
        StreamProcessor(IFaceDetector& detector,
                        IMediaBackend& media,
                        std::ostream& progress_out,
                        const std::atomic<bool>& running,
                        Options opt);

        // Throws SourceOpenError, WriteError, DecodeError, DetectionError.
        StreamResult run(const StreamJob& job);

        std::ostream& progress_out() { return progress_out_; }
        bool running() const { return running_.load(std::memory_order_relaxed); }

    private:
        IFaceDetector& detector_;
        IMediaBackend& media_;
        std::ostream& progress_out_;
        const std::atomic<bool>& running_;
        Options opt_;
    };
}
