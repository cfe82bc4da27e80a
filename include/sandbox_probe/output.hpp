#pragma once
#include <filesystem>
#include <string>
#include "sandbox_probe/types.hpp"

namespace sandbox_probe {
    std::string output_file_name();
    std::filesystem::path output_target(const std::string& output_dir);
    std::string render_output_body(const ProbeReport& report);
    WriteOutcome write_probe_output(const ProbeReport& report);
}
