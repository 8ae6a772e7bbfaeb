#pragma once

#include <string>

#include <inference/yunet_detector.hpp>
#include <pipeline/types.hpp>

namespace fr {
    struct CameraConfig {
        int width = 0;  // 0: device default
        int height = 0;
        int fps = 30;   // used when the device reports no framerate
        bool mjpg = false;
    };

    struct RunConfig {
        float threshold = 0.2f;
        bool preview = true;
    };

    struct BatchConfig {
        std::string ext = "*";
        std::string suffix = "_anonymized";
    };

    struct AppConfig {
        YuNetDetectorConfig detector;
        RedactOptions redact;
        RunConfig run;
        BatchConfig batch;
        CameraConfig camera;
    };

    // Every key is optional; missing keys keep the defaults above.
    AppConfig load_config_yaml(const std::string& path);

    // Throws ConfigError on out-of-range values.
    void validate_config(const AppConfig& cfg);
}
