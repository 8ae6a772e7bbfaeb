#include <pipeline/stream_processor.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>

#include <anonymization/anonymizer.hpp>
#include <common/errors.hpp>
#include <pipeline/progress.hpp>

namespace fr {
    namespace {
        // Everything one job holds open. Destruction is the CLOSING step for
        // paths that leave run() by exception.
        struct OpenStream {
            std::unique_ptr<IFrameSource> src;
            std::unique_ptr<IFrameSink> sink;
            std::unique_ptr<IPreview> preview;
            std::unique_ptr<ProgressBar> bar;

            ~OpenStream() { release(); }

            void release() noexcept {
                bar.reset();
                preview.reset();
                if (sink) {
                    try {
                        sink->close();
                    } catch (const std::exception& e) {
                        std::cerr << "[Stream](close) " << sink->path() << ": " << e.what() << "\n";
                    }
                    sink.reset();
                }
                if (src) {
                    src->close();
                    src.reset();
                }
            }
        };
    } // namespace

    StreamProcessor::StreamProcessor(IFaceDetector& detector,
                                     IMediaBackend& media,
                                     std::ostream& progress_out,
                                     const std::atomic<bool>& running)
        : StreamProcessor(detector, media, progress_out, running, Options{}) {}

    StreamProcessor::StreamProcessor(IFaceDetector& detector,
                                     IMediaBackend& media,
                                     std::ostream& progress_out,
                                     const std::atomic<bool>& running,
                                     Options opt)
        : detector_(detector),
          media_(media),
          progress_out_(progress_out),
          running_(running),
          opt_(opt) {}

    StreamResult StreamProcessor::run(const StreamJob& job) {
        StreamResult result;
        const Anonymizer anonymizer(job.redact);
        OpenStream s;

        // OPENING
        s.src = media_.make_source(job);
        if (!s.src) {
            throw std::runtime_error("[Stream](run) no source for " + job.input);
        }
        s.src->open();
        const SourceInfo info = s.src->info();

        if (job.output) {
            s.sink = media_.make_sink(job);
            if (!s.sink) {
                throw WriteError("[Stream](run) no writer for " + *job.output);
            }
            s.sink->open(info);
        }

        if (job.preview) s.preview = media_.make_preview(job);

        if (job.kind != SourceKind::Image) {
            s.bar = std::make_unique<ProgressBar>(
                progress_out_,
                info.frame_count,
                job.nested ? ProgressBar::Placement::Nested : ProgressBar::Placement::TopLevel);
        }

        // STREAMING
        FramePacket fp;
        for (;;) {
            if (!running_.load(std::memory_order_relaxed)) {
                result.stopped_early = true;
                break;
            }

            const ReadStatus status = s.src->read(fp, opt_.read_timeout_ms);
            if (status == ReadStatus::End) break;
            if (status == ReadStatus::Timeout || fp.bgr.empty()) continue;

            const std::vector<Detection> dets = detector_.detect(fp.bgr, job.threshold);
            anonymizer.apply(fp.bgr, dets);

            if (s.sink) s.sink->write(fp.bgr);
            ++result.frames;
            if (s.bar) s.bar->update();

            if (s.preview && !s.preview->show(fp.bgr)) {
                result.stopped_early = true;
                break;
            }
        }

        // CLOSING; the sink is finalized here so that its errors reach the caller.
        if (s.bar) s.bar->close();
        if (s.sink) s.sink->close();
        s.release();
        return result;
    }
}
