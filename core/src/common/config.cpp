#include <common/config.hpp>

#include <cmath>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <common/errors.hpp>

namespace fr {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static float get_float(
        const YAML::Node& n, const char* key, float def) {
        return (n && n[key]) ? n[key].as<float>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static void parse_detector_config(const YAML::Node& d, YuNetDetectorConfig& c) {
        if (!d) return;
        c.param_path = get_str(d, "param", c.param_path);
        c.bin_path = get_str(d, "bin", c.bin_path);
        c.input_w = get_int(d, "input_w", c.input_w);
        c.input_h = get_int(d, "input_h", c.input_h);
        c.nms_threshold = get_float(d, "nms_threshold", c.nms_threshold);
        c.top_k = get_int(d, "top_k", c.top_k);
        c.ncnn_threads = get_int(d, "threads", c.ncnn_threads);
        if (d["backend"]) c.backend = detector_backend_from_str(d["backend"].as<std::string>());
    }

    static void parse_redaction_config(const YAML::Node& r, RedactOptions& c) {
        if (!r) return;
        if (r["mode"]) c.mode = redact_mode_from_str(r["mode"].as<std::string>());
        c.mask_scale = get_float(r, "mask_scale", c.mask_scale);
        c.ellipse = get_bool(r, "ellipse", c.ellipse);
        c.annotate = get_bool(r, "annotate", c.annotate);
        c.blur_factor = get_int(r, "blur_factor", c.blur_factor);
        c.pixelation_divisor = get_int(r, "pixelation_divisor", c.pixelation_divisor);

        const YAML::Node color = r["color"];
        if (color) {
            if (!color.IsSequence() || color.size() != 3) {
                throw ConfigError("[Config] redaction.color must be a [b, g, r] sequence!");
            }
            const auto v = color.as<std::vector<int>>();
            c.color = cv::Scalar(v[0], v[1], v[2]);
        }
    }

    static void parse_run_config(const YAML::Node& r, RunConfig& c) {
        if (!r) return;
        c.threshold = get_float(r, "threshold", c.threshold);
        c.preview = get_bool(r, "preview", c.preview);
    }

    static void parse_batch_config(const YAML::Node& b, BatchConfig& c) {
        if (!b) return;
        c.ext = get_str(b, "ext", c.ext);
        c.suffix = get_str(b, "suffix", c.suffix);
    }

    static void parse_camera_config(const YAML::Node& cam, CameraConfig& c) {
        if (!cam) return;
        c.width = get_int(cam, "width", c.width);
        c.height = get_int(cam, "height", c.height);
        c.fps = get_int(cam, "fps", c.fps);
        c.mjpg = get_bool(cam, "mjpg", get_bool(cam, "mjpeg", c.mjpg));
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);
        if (!root || root.IsNull()) return cfg;
        if (!root.IsMap()) {
            throw ConfigError("[Config] top level of " + path + " must be a map!");
        }

        parse_detector_config(root["detector"], cfg.detector);
        parse_redaction_config(root["redaction"], cfg.redact);
        parse_run_config(root["run"], cfg.run);
        parse_batch_config(root["batch"], cfg.batch);
        parse_camera_config(root["camera"], cfg.camera);

        validate_config(cfg);
        return cfg;
    }

    void validate_config(const AppConfig& cfg) {
        if (!std::isfinite(cfg.run.threshold) || cfg.run.threshold < 0.0f || cfg.run.threshold > 1.0f) {
            throw ConfigError("[Config] threshold must be within [0, 1]!");
        }
        if (!std::isfinite(cfg.redact.mask_scale)) {
            throw ConfigError("[Config] mask_scale must be a finite number!");
        }
        if (cfg.redact.blur_factor <= 0) {
            throw ConfigError("[Config] blur_factor must be positive!");
        }
        if (cfg.redact.pixelation_divisor <= 0) {
            throw ConfigError("[Config] pixelation_divisor must be positive!");
        }
        if ((cfg.detector.input_w > 0) != (cfg.detector.input_h > 0)) {
            throw ConfigError("[Config] detector input_w and input_h must be set together!");
        }
        if (cfg.camera.fps <= 0) {
            throw ConfigError("[Config] camera fps must be positive!");
        }
        if (cfg.batch.ext.empty()) {
            throw ConfigError("[Config] batch ext must not be empty (use \"*\")!");
        }
        if (cfg.batch.suffix.empty()) {
            throw ConfigError("[Config] batch suffix must not be empty, outputs would replace inputs!");
        }
    }
}
