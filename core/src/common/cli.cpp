#include <common/cli.hpp>

#include <cstdlib>
#include <sstream>

#include <common/errors.hpp>

namespace fr {
    namespace {
        float parse_float(const std::string& flag, const std::string& v) {
            char* end = nullptr;
            const float f = std::strtof(v.c_str(), &end);
            if (v.empty() || end == nullptr || *end != '\0') {
                throw ConfigError("invalid value for " + flag + ": " + v);
            }
            return f;
        }

        void parse_scale(const std::string& v, int& w, int& h) {
            const auto x = v.find('x');
            if (x == std::string::npos) {
                throw ConfigError("--scale expects WxH, got: " + v);
            }
            char* end = nullptr;
            const long pw = std::strtol(v.substr(0, x).c_str(), &end, 10);
            const bool w_ok = end && *end == '\0';
            const long ph = std::strtol(v.substr(x + 1).c_str(), &end, 10);
            const bool h_ok = end && *end == '\0';
            if (!w_ok || !h_ok || pw <= 0 || ph <= 0) {
                throw ConfigError("--scale expects WxH, got: " + v);
            }
            w = static_cast<int>(pw);
            h = static_cast<int>(ph);
        }
    } // namespace

    CliArgs parse_args(int argc, const char* const* argv) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
        return parse_args(args);
    }

    CliArgs parse_args(const std::vector<std::string>& args) {
        CliArgs cli;
        bool have_input = false;

        for (size_t i = 0; i < args.size(); ++i) {
            std::string arg = args[i];
            std::optional<std::string> inline_value;
            if (arg.rfind("--", 0) == 0) {
                const auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    inline_value = arg.substr(eq + 1);
                    arg = arg.substr(0, eq);
                }
            }

            auto value = [&]() -> std::string {
                if (inline_value) return *inline_value;
                if (i + 1 >= args.size()) throw ConfigError("missing value for " + arg);
                return args[++i];
            };

            if (arg == "-o" || arg == "--output") {
                cli.output = value();
            } else if (arg == "-t" || arg == "--thresh") {
                cli.threshold = parse_float(arg, value());
            } else if (arg == "-s" || arg == "--scale") {
                parse_scale(value(), cli.scale_w, cli.scale_h);
            } else if (arg == "--mask-scale") {
                cli.mask_scale = parse_float(arg, value());
            } else if (arg == "--replacewith") {
                cli.replacewith = value();
            } else if (arg == "--backend") {
                cli.backend = value();
            } else if (arg == "--ext") {
                cli.ext = value();
            } else if (arg == "-c" || arg == "--config") {
                cli.config_path = value();
            } else if (arg == "-q" || arg == "--disable-gui") {
                cli.disable_gui = true;
            } else if (arg == "-e" || arg == "--enable-enum") {
                cli.enable_enum = true;
            } else if (arg == "--enable-boxes") {
                cli.enable_boxes = true;
            } else if (arg == "--version") {
                cli.version = true;
            } else if (arg == "-h" || arg == "--help") {
                cli.help = true;
            } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
                throw ConfigError("unknown option: " + arg);
            } else {
                if (have_input) throw ConfigError("unexpected argument: " + arg);
                cli.input = arg;
                have_input = true;
            }
        }
        return cli;
    }

    void apply_cli(const CliArgs& args, AppConfig& cfg) {
        if (args.threshold) cfg.run.threshold = *args.threshold;
        if (args.mask_scale) cfg.redact.mask_scale = *args.mask_scale;
        if (args.replacewith) cfg.redact.mode = redact_mode_from_str(*args.replacewith);
        if (args.backend) cfg.detector.backend = detector_backend_from_str(*args.backend);
        if (args.ext) cfg.batch.ext = *args.ext;
        if (args.scale_w > 0 && args.scale_h > 0) {
            cfg.detector.input_w = args.scale_w;
            cfg.detector.input_h = args.scale_h;
        }
        if (args.disable_gui) cfg.run.preview = false;
        if (args.enable_enum) cfg.redact.annotate = true;
        if (args.enable_boxes) cfg.redact.ellipse = false;

        validate_config(cfg);
    }

    std::string usage(const std::string& prog) {
        std::ostringstream os;
        os << "Usage: " << prog << " [input] [options]\n"
           << "\n"
           << "Video anonymization by face detection.\n"
           << "\n"
           << "  input                 video/image/directory path or camera device\n"
           << "                        (default: <video0>, the first camera)\n"
           << "  -o, --output O        output file (default: input path + \"_anonymized\")\n"
           << "  -t, --thresh T        detection threshold (default: 0.2)\n"
           << "  -s, --scale WxH       run the detector at this input size (e.g. 640x360)\n"
           << "  -q, --disable-gui     no preview window for single video/camera input\n"
           << "  -e, --enable-enum     draw detection numbers and scores\n"
           << "      --enable-boxes    redact boxes instead of ellipses\n"
           << "      --mask-scale M    grow face masks by this factor (default: 1.3)\n"
           << "      --replacewith R   solid|blur|pixelate|none (default: blur)\n"
           << "      --backend B       auto|gpu|cpu (default: auto)\n"
           << "      --ext EXT         extension filter for directory input (default: *)\n"
           << "  -c, --config FILE     YAML config, overridden by the flags above\n"
           << "      --version         print version and exit\n"
           << "  -h, --help            show this help and exit\n";
        return os.str();
    }
}
