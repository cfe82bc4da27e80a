#include <string>
#include "sandbox_probe/utils.hpp"
#include "sandbox_probe/render.hpp"
#include "sandbox_probe/environment.hpp"

namespace sandbox_probe {

    namespace {
        constexpr const char* kColorReset = "\033[0m";
        constexpr const char* kColorBanner = "\033[1;37m";
        constexpr const char* kColorKey = "\033[1;34m";
        constexpr const char* kColorValue = "\033[1;32m";
        constexpr const char* kColorWarn = "\033[1;33m";
        constexpr const char* kColorError = "\033[1;31m";

        class Painter {
        public:
            Painter(std::ostream& out, const RenderOptions& options) : out_(out), color_(options.color) {}

            void banner(const std::string& title) {
                out_ << paint(kColorBanner) << "=== " << title << " ===" << reset() << "\n";
            }

            void field(const std::string& key, const std::string& value) {
                out_ << paint(kColorKey) << key << ": " << paint(kColorValue) << value << reset() << "\n";
            }

            void ok(const std::string& message) {
                out_ << paint(kColorValue) << "✓ " << message << reset() << "\n";
            }

            void warn(const std::string& message) {
                out_ << paint(kColorWarn) << "⚠ " << message << reset() << "\n";
            }

            void fail(const std::string& message) {
                out_ << paint(kColorError) << "✗ " << message << reset() << "\n";
            }

            void line(const std::string& text) {
                out_ << text << "\n";
            }

            void blank() {
                out_ << "\n";
            }

        private:
            const char* paint(const char* code) const {
                return color_ ? code : "";
            }

            const char* reset() const {
                return color_ ? kColorReset : "";
            }

            std::ostream& out_;
            bool color_;
        };
    }

    void render_header(std::ostream& out, const ProbeRun& run, const RenderOptions& options) {
        Painter painter(out, options);
        painter.banner(std::string(kLanguageName) + " Sandbox Test");
        painter.field(std::string(kLanguageName) + " version", run.runtime_version);
        painter.field("Host", run.host);
        painter.field("Timestamp", run.timestamp);
        painter.blank();
    }

    void render_environment(std::ostream& out, const ProbeReport& report, const RenderOptions& options) {
        Painter painter(out, options);
        painter.banner("Environment Variables");
        painter.field(kCaseIdVar, report.case_id);
        painter.field(kEvidenceUidVar, report.evidence_uid);
        painter.field(kEvidencePathVar, report.evidence_path);
        painter.field(kOutputDirVar, report.output_dir);
        painter.blank();
    }

    void render_libraries(std::ostream& out, const ProbeRun& run, const RenderOptions& options) {
        Painter painter(out, options);
        painter.banner("Runtime Libraries");
        for (const auto& library : run.libraries) {
            painter.ok(library.name + " " + library.version + " linked");
        }
        painter.blank();
    }

    void render_evidence(std::ostream& out, std::ostream& err, const ProbeRun& run, const RenderOptions& options) {
        Painter painter(out, options);
        painter.banner("Evidence Access");

        if (!run.evidence) {
            painter.warn("EVIDENCE_PATH not set, skipping evidence access test");
            painter.blank();
            return;
        }

        const EvidenceReport& evidence = *run.evidence;
        if (!evidence.exists) {
            painter.fail("Evidence not accessible: " + evidence.error);
            painter.blank();
            return;
        }

        painter.ok("Evidence readable: " + evidence.path.string());
        painter.field("Type", evidence.type);
        if (evidence.permissions) {
            painter.field("Permissions", *evidence.permissions);
        }
        if (evidence.size_human) {
            painter.field("Size", *evidence.size_human + " (" + std::to_string(*evidence.size_bytes) + " bytes)");
        }
        if (evidence.sha256) {
            painter.field("SHA-256", *evidence.sha256);
        } else if (evidence.sha256_skipped_above) {
            painter.field("SHA-256", "skipped (size > " + format_size(*evidence.sha256_skipped_above) + ")");
        }
        if (evidence.resolution) {
            painter.field("Resolution", *evidence.resolution);
        }
        if (evidence.duration) {
            painter.field("Duration", *evidence.duration);
        }
        if (evidence.entry_count) {
            painter.field("Entries", std::to_string(*evidence.entry_count));
        }
        painter.blank();

        for (const auto& warning : evidence.warnings) {
            err << (options.color ? kColorError : "") << "Warning: " << warning
                << (options.color ? kColorReset : "") << "\n";
        }
    }

    void render_write(std::ostream& out, const WriteOutcome& outcome, const RenderOptions& options) {
        Painter painter(out, options);
        switch (outcome.status) {
            case WriteStatus::Skipped:
                painter.warn("OUTPUT_DIR not set, skipping file write test");
                break;
            case WriteStatus::Written:
                painter.ok("Output file written: " + outcome.target.string());
                break;
            case WriteStatus::Failed:
                painter.fail("Output write failed: " + outcome.error);
                break;
        }
        painter.blank();
    }

    void render_footer(std::ostream& out, const RenderOptions& options) {
        Painter painter(out, options);
        painter.banner("Test Complete");
        painter.line("Exit code: 0");
    }
}
