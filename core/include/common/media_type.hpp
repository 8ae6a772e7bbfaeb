#pragma once

#include <filesystem>
#include <string>

namespace fr {
    enum class MediaKind {
        Image,
        Video,
        Unknown
    };

    std::string to_string(MediaKind k);

    // Extension first, then the file header for missing/unknown extensions.
    MediaKind classify_media(const std::filesystem::path& path);
    MediaKind media_kind_from_extension(const std::filesystem::path& path);
    MediaKind media_kind_from_header(const std::filesystem::path& path);

    // photo.jpg -> photo<suffix>.jpg
    std::filesystem::path derive_output_path(const std::filesystem::path& input,
                                             const std::string& suffix = "_anonymized");
}
