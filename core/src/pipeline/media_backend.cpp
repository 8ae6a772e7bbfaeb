#include <pipeline/media_backend.hpp>

#include <encode/gst_video_sink.hpp>
#include <encode/image_sink.hpp>
#include <ingest/frame_source_factory.hpp>

namespace fr {
    DefaultMediaBackend::DefaultMediaBackend(CameraConfig cam) : cam_(cam) {}

    std::unique_ptr<IFrameSource> DefaultMediaBackend::make_source(const StreamJob& job) {
        return make_frame_source(job, cam_);
    }

    std::unique_ptr<IFrameSink> DefaultMediaBackend::make_sink(const StreamJob& job) {
        if (!job.output) return nullptr;
        if (job.kind == SourceKind::Image) {
            return std::make_unique<ImageSink>(*job.output);
        }
        return std::make_unique<GstVideoSink>(*job.output);
    }

    std::unique_ptr<IPreview> DefaultMediaBackend::make_preview(const StreamJob&) {
        return std::make_unique<PreviewWindow>("Anonymized");
    }
}
