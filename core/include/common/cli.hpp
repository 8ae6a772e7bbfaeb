#pragma once

#include <optional>
#include <string>
#include <vector>

#include <common/config.hpp>

namespace fr {
    struct CliArgs {
        std::string input = "<video0>";
        std::optional<std::string> output;
        std::optional<std::string> config_path;

        std::optional<float> threshold;
        std::optional<float> mask_scale;
        std::optional<std::string> replacewith;
        std::optional<std::string> backend;
        std::optional<std::string> ext;
        int scale_w = 0; // --scale WxH
        int scale_h = 0;

        bool disable_gui = false;
        bool enable_enum = false;
        bool enable_boxes = false;

        bool help = false;
        bool version = false;
    };

    // Accepts "--flag value" and "--flag=value". Throws ConfigError.
    CliArgs parse_args(int argc, const char* const* argv);
    CliArgs parse_args(const std::vector<std::string>& args);

    // Command-line values win over the config file.
    void apply_cli(const CliArgs& args, AppConfig& cfg);

    std::string usage(const std::string& prog);
}
