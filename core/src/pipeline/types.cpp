#include <pipeline/types.hpp>

#include <algorithm>
#include <cctype>

#include <common/errors.hpp>

namespace fr {
    namespace {
        std::string to_lower(std::string s) {
            std::transform(s.begin(),
                           s.end(),
                           s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }
    } // namespace

    RedactMode redact_mode_from_str(const std::string& s) {
        const std::string m = to_lower(s);
        if (m == "solid") return RedactMode::Solid;
        if (m == "blur") return RedactMode::Blur;
        if (m == "pixelate") return RedactMode::Pixelate;
        if (m == "none") return RedactMode::None;
        throw ConfigError("unknown redaction mode: " + s);
    }

    std::string to_string(RedactMode m) {
        switch (m) {
            case RedactMode::Solid: return "solid";
            case RedactMode::Blur: return "blur";
            case RedactMode::Pixelate: return "pixelate";
            case RedactMode::None: return "none";
        }
        return "unk";
    }

    std::string to_string(SourceKind k) {
        switch (k) {
            case SourceKind::Image: return "image";
            case SourceKind::VideoFile: return "video";
            case SourceKind::Camera: return "camera";
        }
        return "unk";
    }
}
