#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace sandbox_probe {
    std::string sha256_hex(const std::string& data);
    std::optional<std::string> compute_sha256(const std::filesystem::path& path);
}
