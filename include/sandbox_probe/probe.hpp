#pragma once
#include <ostream>
#include "sandbox_probe/render.hpp"
#include "sandbox_probe/types.hpp"

namespace sandbox_probe {
    ProbeRun collect_probe_run(const ProbeReport& report);
    int run_probe(std::ostream& out, std::ostream& err, const RenderOptions& options);
}
