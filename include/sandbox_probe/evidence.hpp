#pragma once
#include <cstdint>
#include <filesystem>
#include "sandbox_probe/types.hpp"

namespace sandbox_probe {
    // Evidence files larger than this are reported but not hashed.
    inline constexpr uintmax_t kEvidenceHashLimit = 64ull * 1024 * 1024;

    EvidenceReport inspect_evidence(const std::filesystem::path& path, uintmax_t hash_limit = kEvidenceHashLimit);
}
