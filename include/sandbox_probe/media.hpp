#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "sandbox_probe/types.hpp"

namespace sandbox_probe {
    bool is_image_extension(const std::filesystem::path& path);
    bool is_video_extension(const std::filesystem::path& path);
    bool is_audio_extension(const std::filesystem::path& path);

    std::vector<LibraryInfo> linked_media_libraries();
    std::optional<std::string> image_resolution(const std::filesystem::path& path);
    std::optional<std::string> media_resolution(const std::filesystem::path& path);
    std::optional<std::string> media_duration(const std::filesystem::path& path);
}
