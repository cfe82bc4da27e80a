#pragma once
#include <string>
#include "sandbox_probe/types.hpp"

namespace sandbox_probe {
    inline constexpr const char* kCaseIdVar = "CASE_ID";
    inline constexpr const char* kEvidenceUidVar = "EVIDENCE_UID";
    inline constexpr const char* kEvidencePathVar = "EVIDENCE_PATH";
    inline constexpr const char* kOutputDirVar = "OUTPUT_DIR";

    std::string env_or(const char* name, const std::string& fallback);
    bool is_set(const std::string& value);
    ProbeReport read_probe_report();
}
