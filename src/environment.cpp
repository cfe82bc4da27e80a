#include <cstdlib>
#include "sandbox_probe/environment.hpp"

namespace sandbox_probe {

    std::string env_or(const char* name, const std::string& fallback) {
        // An empty value still counts as set.
        if (const char* value = std::getenv(name)) {
            return value;
        }
        return fallback;
    }

    bool is_set(const std::string& value) {
        return value != kNotSet;
    }

    ProbeReport read_probe_report() {
        ProbeReport report;
        report.case_id = env_or(kCaseIdVar, kNotSet);
        report.evidence_uid = env_or(kEvidenceUidVar, kNotSet);
        report.evidence_path = env_or(kEvidencePathVar, kNotSet);
        report.output_dir = env_or(kOutputDirVar, kNotSet);
        return report;
    }
}
