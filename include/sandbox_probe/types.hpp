#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sandbox_probe {
    inline constexpr const char* kNotSet = "NOT_SET";
    inline constexpr const char* kLanguageTag = "cpp";
    inline constexpr const char* kLanguageName = "C++";

    struct ProbeReport {
        std::string case_id = kNotSet;
        std::string evidence_uid = kNotSet;
        std::string evidence_path = kNotSet;
        std::string output_dir = kNotSet;
    };

    enum class WriteStatus {
        Skipped,
        Written,
        Failed
    };

    struct WriteOutcome {
        WriteStatus status = WriteStatus::Skipped;
        std::filesystem::path target;
        std::string error;
    };

    struct EvidenceReport {
        std::filesystem::path path;
        bool exists = false;
        std::string type = "Unknown";
        std::string error;
        std::optional<std::string> permissions;
        std::optional<uintmax_t> size_bytes;
        std::optional<std::string> size_human;
        std::optional<std::string> sha256;
        std::optional<uintmax_t> sha256_skipped_above;
        std::optional<std::string> resolution;
        std::optional<std::string> duration;
        std::optional<std::size_t> entry_count;
        std::vector<std::string> warnings;
    };

    struct LibraryInfo {
        std::string name;
        std::string version;
    };

    struct ProbeRun {
        ProbeReport report;
        std::string runtime_version;
        std::string host;
        std::string timestamp;
        std::vector<LibraryInfo> libraries;
        std::optional<EvidenceReport> evidence;
        WriteOutcome write;
    };
}
