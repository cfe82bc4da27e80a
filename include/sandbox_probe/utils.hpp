#pragma once
#include <ctime>
#include <cstdint>
#include <filesystem>
#include <string>

namespace sandbox_probe {
    std::string format_size(uintmax_t size);
    std::string format_permissions(std::filesystem::perms perms);
    std::string format_utc_time(std::time_t value);
    std::string format_duration(long long total_seconds);
    std::string to_lowercase(std::string value);
    bool is_text_file(const std::filesystem::path& path);
}
