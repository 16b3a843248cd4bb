// growthfit log-phase: exponential growth window per sample
//
// Smooths each sample once and reports the detected window with the growth
// rate fitted over its points.

#include "subcommand.hpp"
#include "args.hpp"
#include "common.hpp"
#include "growthfit/log_utils.hpp"
#include "growthfit/payload_writer.hpp"

#include <chrono>
#include <iostream>

namespace growthfit {
namespace cli {

int cmd_log_phase(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != 0) {
            std::cerr << e.what() << "\n";
            std::cerr << "Use --help for usage.\n";
        }
        return e.exit_code();
    }

    try {
        auto t_start = std::chrono::steady_clock::now();
        setup_threads(opts.num_threads);

        CurveWorkspace workspace = load_workspace(opts);

        if (opts.verbose) {
            const auto& d = workspace.config().detection;
            std::cerr << "Log-phase detection: window=" << d.window_size
                      << " r2>=" << d.r2_min << " od>=" << d.od_min
                      << " y/K<" << d.frac_k_max
                      << " mu_rel=[" << d.mu_rel_min << ", " << d.mu_rel_max << "]\n";
        }

        ApplyReport report = workspace.apply_smoothing(workspace.sample_names(), opts.smoothing,
                                                       progress_printer(opts.verbose));
        std::vector<LogPhaseSelection> phases = workspace.log_phases();

        OutputStream out(opts.output_file);
        write_log_phases_tsv(out.get(), phases);
        out.finish();

        if (opts.verbose) {
            std::cerr << "Smoothed: " << report.applied;
            if (report.skipped > 0) std::cerr << " (" << report.skipped << " skipped)";
            std::cerr << "\n";
            std::cerr << "Log phases: " << phases.size() << "/" << workspace.size() << "\n";
            std::cerr << "Total time: "
                      << log_utils::format_elapsed(t_start, std::chrono::steady_clock::now())
                      << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

namespace {
    struct LogPhaseRegistrar {
        LogPhaseRegistrar() {
            SubcommandRegistry::instance().register_command(
                "log-phase",
                "Detect exponential growth windows (TSV)",
                cmd_log_phase, 30);
        }
    } log_phase_registrar;
}

}  // namespace cli
}  // namespace growthfit
