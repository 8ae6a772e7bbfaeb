#include <common/media_type.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <fstream>
#include <unordered_set>

namespace fr {
    namespace {
        const std::unordered_set<std::string> kImageExts = {
            ".jpg", ".jpeg", ".jpe", ".png", ".bmp", ".gif", ".tif", ".tiff",
            ".webp", ".ppm", ".pgm", ".pbm", ".pnm", ".jp2", ".exr", ".hdr"
        };

        const std::unordered_set<std::string> kVideoExts = {
            ".mp4", ".m4v", ".mov", ".qt", ".avi", ".mkv", ".webm", ".mpg",
            ".mpeg", ".mpe", ".m1v", ".m2v", ".wmv", ".asf", ".flv", ".3gp",
            ".3g2", ".ts", ".mts", ".m2ts", ".ogv"
        };

        std::string lower(std::string s) {
            std::transform(s.begin(),
                           s.end(),
                           s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool starts_with(const unsigned char* buf, size_t n, const char* magic, size_t m, size_t at = 0) {
            return n >= at + m && std::memcmp(buf + at, magic, m) == 0;
        }
    } // namespace

    std::string to_string(MediaKind k) {
        switch (k) {
            case MediaKind::Image: return "image";
            case MediaKind::Video: return "video";
            case MediaKind::Unknown: return "unknown";
        }
        return "unknown";
    }

    MediaKind media_kind_from_extension(const std::filesystem::path& path) {
        const std::string ext = lower(path.extension().string());
        if (ext.empty()) return MediaKind::Unknown;
        if (kImageExts.count(ext)) return MediaKind::Image;
        if (kVideoExts.count(ext)) return MediaKind::Video;
        return MediaKind::Unknown;
    }

    MediaKind media_kind_from_header(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) return MediaKind::Unknown;

        std::array<unsigned char, 16> head{};
        in.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
        const size_t n = static_cast<size_t>(in.gcount());
        const unsigned char* b = head.data();

        // images
        if (starts_with(b, n, "\xFF\xD8\xFF", 3)) return MediaKind::Image;                 // jpeg
        if (starts_with(b, n, "\x89PNG\r\n\x1A\n", 8)) return MediaKind::Image;            // png
        if (starts_with(b, n, "GIF87a", 6) || starts_with(b, n, "GIF89a", 6)) return MediaKind::Image;
        if (starts_with(b, n, "BM", 2)) return MediaKind::Image;                           // bmp
        if (starts_with(b, n, "II*\0", 4) || starts_with(b, n, "MM\0*", 4)) return MediaKind::Image;
        if (starts_with(b, n, "RIFF", 4) && starts_with(b, n, "WEBP", 4, 8)) return MediaKind::Image;

        // video
        if (starts_with(b, n, "ftyp", 4, 4)) return MediaKind::Video;                      // mp4/mov
        if (starts_with(b, n, "\x1A\x45\xDF\xA3", 4)) return MediaKind::Video;             // mkv/webm
        if (starts_with(b, n, "RIFF", 4) && starts_with(b, n, "AVI ", 4, 8)) return MediaKind::Video;
        if (starts_with(b, n, "\x00\x00\x01\xBA", 4)) return MediaKind::Video;             // mpeg-ps
        if (starts_with(b, n, "FLV", 3)) return MediaKind::Video;
        if (n >= 1 && b[0] == 0x47) {
            // mpeg-ts: sync byte every 188 bytes
            in.clear();
            in.seekg(188, std::ios::beg);
            char next = 0;
            if (in.get(next) && static_cast<unsigned char>(next) == 0x47) return MediaKind::Video;
        }
        return MediaKind::Unknown;
    }

    MediaKind classify_media(const std::filesystem::path& path) {
        const MediaKind by_ext = media_kind_from_extension(path);
        if (by_ext != MediaKind::Unknown) return by_ext;
        return media_kind_from_header(path);
    }

    std::filesystem::path derive_output_path(const std::filesystem::path& input, const std::string& suffix) {
        std::filesystem::path out = input;
        out.replace_filename(input.stem().string() + suffix + input.extension().string());
        return out;
    }
}
