#include <cerrno>
#include <fstream>
#include <sstream>
#include <utility>
#include <system_error>
#include "sandbox_probe/output.hpp"
#include "sandbox_probe/environment.hpp"

namespace sandbox_probe {

    namespace {
        std::string describe_errno(int error, const char* fallback) {
            if (error == 0) {
                return fallback;
            }
            return std::error_code(error, std::generic_category()).message();
        }

        WriteOutcome failed(const std::filesystem::path& target, std::string error) {
            WriteOutcome outcome;
            outcome.status = WriteStatus::Failed;
            outcome.target = target;
            outcome.error = std::move(error);
            return outcome;
        }
    }

    std::string output_file_name() {
        return std::string("test_output_") + kLanguageTag + ".txt";
    }

    std::filesystem::path output_target(const std::string& output_dir) {
        return std::filesystem::path(output_dir) / output_file_name();
    }

    std::string render_output_body(const ProbeReport& report) {
        std::ostringstream oss;
        oss << "Test output from " << kLanguageName << " sandbox\n"
            << "Case ID: " << report.case_id << "\n"
            << "Evidence UID: " << report.evidence_uid << "\n";
        return oss.str();
    }

    WriteOutcome write_probe_output(const ProbeReport& report) {
        if (!is_set(report.output_dir)) {
            return WriteOutcome{};
        }

        const std::filesystem::path target = output_target(report.output_dir);
        const std::string body = render_output_body(report);

        errno = 0;
        std::ofstream file(target, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file) {
            return failed(target, describe_errno(errno, "unable to create output file"));
        }

        errno = 0;
        file.write(body.data(), static_cast<std::streamsize>(body.size()));
        file.flush();
        if (!file) {
            return failed(target, describe_errno(errno, "unable to write output file"));
        }

        errno = 0;
        file.close();
        if (file.fail()) {
            return failed(target, describe_errno(errno, "unable to close output file"));
        }

        WriteOutcome outcome;
        outcome.status = WriteStatus::Written;
        outcome.target = target;
        return outcome;
    }
}
