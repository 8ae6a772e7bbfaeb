#pragma once

#include <memory>
#include <string>

#include <common/config.hpp>
#include <ingest/frame_source.hpp>
#include <pipeline/types.hpp>

namespace fr {
    // "<video0>" and "/dev/video0" name cameras.
    bool is_camera_input(const std::string& input);
    std::string camera_device(const std::string& input);

    // Picks the source variant for job.kind. The source is not opened yet.
    std::unique_ptr<IFrameSource> make_frame_source(const StreamJob& job, const CameraConfig& cam);
}
