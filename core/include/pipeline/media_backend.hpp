#pragma once

#include <memory>

#include <common/config.hpp>
#include <display/preview.hpp>
#include <encode/frame_sink.hpp>
#include <ingest/frame_source.hpp>
#include <pipeline/types.hpp>

namespace fr {
    // Opens the I/O collaborators of one StreamJob.
    class IMediaBackend {
    public:
        virtual ~IMediaBackend() = default;

        virtual std::unique_ptr<IFrameSource> make_source(const StreamJob& job) = 0;
        // Only called when job.output is set.
        virtual std::unique_ptr<IFrameSink> make_sink(const StreamJob& job) = 0;
        virtual std::unique_ptr<IPreview> make_preview(const StreamJob& job) = 0;
    };

    // GStreamer for video, imgcodecs for stills, highgui for preview.
    class DefaultMediaBackend : public IMediaBackend {
    public:
        explicit DefaultMediaBackend(CameraConfig cam = {});

        std::unique_ptr<IFrameSource> make_source(const StreamJob& job) override;
        std::unique_ptr<IFrameSink> make_sink(const StreamJob& job) override;
        std::unique_ptr<IPreview> make_preview(const StreamJob& job) override;

    private:
        CameraConfig cam_;
    };
}
