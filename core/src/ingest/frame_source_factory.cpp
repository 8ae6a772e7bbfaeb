#include <ingest/frame_source_factory.hpp>

#include <cctype>
#include <filesystem>

#include <common/errors.hpp>
#include <ingest/gst_frame_source.hpp>
#include <ingest/image_source.hpp>

namespace fr {
    namespace {
        const std::string kSinkName = "fr_sink";
        const std::string kDevPrefix = "/dev/video";

        bool all_digits(const std::string& s) {
            if (s.empty()) return false;
            for (unsigned char c : s) {
                if (!std::isdigit(c)) return false;
            }
            return true;
        }
    } // namespace

    bool is_camera_input(const std::string& input) {
        if (input.size() > 7 && input.rfind("<video", 0) == 0 && input.back() == '>') {
            return all_digits(input.substr(6, input.size() - 7));
        }
        return input.rfind(kDevPrefix, 0) == 0 && all_digits(input.substr(kDevPrefix.size()));
    }

    std::string camera_device(const std::string& input) {
        if (input.rfind("<video", 0) == 0 && input.back() == '>') {
            return kDevPrefix + input.substr(6, input.size() - 7);
        }
        return input;
    }

    static std::string cam_pipeline(const std::string& device, const CameraConfig& c, const std::string& sink_name) {
        std::string caps;
        if (c.width > 0 && c.height > 0) {
            caps = ",width=" + std::to_string(c.width) + ",height=" + std::to_string(c.height);
        }
        if (c.mjpg) {
            return "v4l2src device=" + device + " ! "
                   "image/jpeg" + caps + " ! "
                   "jpegdec ! videoconvert ! video/x-raw,format=BGR ! "
                   "appsink name=" + sink_name + " max-buffers=2 drop=true sync=false";
        }
        std::string raw = "video/x-raw" + caps + " ! ";
        return "v4l2src device=" + device + " ! " + (caps.empty() ? std::string() : raw) +
               "videoconvert ! video/x-raw,format=BGR ! "
               "appsink name=" + sink_name + " max-buffers=2 drop=true sync=false";
    }

    static std::string file_pipeline(const std::string& path, const std::string& sink_name) {
        return "filesrc location=\"" + path + "\" ! "
               "decodebin ! videoconvert ! video/x-raw,format=BGR ! "
               "appsink name=" + sink_name + " max-buffers=4 drop=false sync=false";
    }

    std::unique_ptr<IFrameSource> make_frame_source(const StreamJob& job, const CameraConfig& cam) {
        namespace fs = std::filesystem;

        switch (job.kind) {
            case SourceKind::Image:
                return std::make_unique<ImageSource>(job.input);

            case SourceKind::VideoFile: {
                if (!fs::is_regular_file(job.input)) {
                    throw SourceOpenError(SourceOpenError::Reason::NotFound, job.input, "");
                }
                auto src = std::make_unique<GstFrameSource>(file_pipeline(job.input, kSinkName),
                                                            job.input,
                                                            kSinkName,
                                                            false);
                src->set_fallback_fps(static_cast<double>(cam.fps));
                return src;
            }

            case SourceKind::Camera: {
                const std::string device = camera_device(job.input);
                if (!fs::exists(device)) {
                    throw SourceOpenError(SourceOpenError::Reason::NoDevice, device, "");
                }
                auto src = std::make_unique<GstFrameSource>(cam_pipeline(device, cam, kSinkName),
                                                            device,
                                                            kSinkName,
                                                            true);
                src->set_fallback_fps(static_cast<double>(cam.fps));
                return src;
            }
        }
        throw std::runtime_error("Unknown source kind " + to_string(job.kind));
    }
}
