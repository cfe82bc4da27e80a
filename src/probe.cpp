#include "sandbox_probe/media.hpp"
#include "sandbox_probe/probe.hpp"
#include "sandbox_probe/output.hpp"
#include "sandbox_probe/runtime.hpp"
#include "sandbox_probe/evidence.hpp"
#include "sandbox_probe/environment.hpp"

namespace sandbox_probe {

    ProbeRun collect_probe_run(const ProbeReport& report) {
        ProbeRun run;
        run.report = report;
        run.runtime_version = runtime_version();
        run.host = host_description();
        run.timestamp = utc_timestamp();
        run.libraries = linked_media_libraries();
        if (is_set(report.evidence_path)) {
            run.evidence = inspect_evidence(report.evidence_path);
        }
        return run;
    }

    int run_probe(std::ostream& out, std::ostream& err, const RenderOptions& options) {
        const ProbeReport report = read_probe_report();
        ProbeRun run = collect_probe_run(report);

        render_header(out, run, options);
        render_environment(out, run.report, options);
        render_libraries(out, run, options);
        render_evidence(out, err, run, options);

        run.write = write_probe_output(run.report);
        render_write(out, run.write, options);

        render_footer(out, options);
        out.flush();
        return 0;
    }
}
