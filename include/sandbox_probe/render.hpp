#pragma once
#include <ostream>
#include "sandbox_probe/types.hpp"

namespace sandbox_probe {
    struct RenderOptions {
        bool color = false;
    };

    void render_header(std::ostream& out, const ProbeRun& run, const RenderOptions& options);
    void render_environment(std::ostream& out, const ProbeReport& report, const RenderOptions& options);
    void render_libraries(std::ostream& out, const ProbeRun& run, const RenderOptions& options);
    void render_evidence(std::ostream& out, std::ostream& err, const ProbeRun& run, const RenderOptions& options);
    void render_write(std::ostream& out, const WriteOutcome& outcome, const RenderOptions& options);
    void render_footer(std::ostream& out, const RenderOptions& options);
}
