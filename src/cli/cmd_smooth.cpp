// growthfit smooth: LOESS smoothing + automatic log-phase detection
//
// Reads a long curve table, applies the smoother to every sample (--passes
// times), detects log phases on the latest curve and writes the JSON payload.
// Bands are computed on request (--band-mode / --bands).

#include "subcommand.hpp"
#include "args.hpp"
#include "common.hpp"
#include "growthfit/log_utils.hpp"
#include "growthfit/payload_writer.hpp"
#include "growthfit/version.h"

#include <chrono>
#include <iomanip>
#include <iostream>

namespace growthfit {
namespace cli {

int cmd_smooth(int argc, char* argv[]) {
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
        int num_threads = setup_threads(opts.num_threads);

        if (opts.verbose) {
            std::cerr << "Curve smoothing v" << GROWTHFIT_VERSION << "\n";
            std::cerr << "  span=" << opts.smoothing.span
                      << " degree=" << opts.smoothing.degree
                      << " robust-iters=" << opts.smoothing.robust_iterations
                      << " max-refinements=" << opts.smoothing.max_refinements
                      << " tol=" << opts.smoothing.convergence_tolerance << "\n";
            std::cerr << "  Threads: " << num_threads << "\n";
        }

        CurveWorkspace workspace = load_workspace(opts);
        const std::vector<std::string> ids = workspace.sample_names();
        auto progress = progress_printer(opts.verbose);

        for (int pass = 1; pass <= opts.passes; ++pass) {
            auto t_pass = std::chrono::steady_clock::now();
            ApplyReport report = workspace.apply_smoothing(ids, opts.smoothing, progress);
            if (opts.verbose) {
                std::cerr << "Pass " << pass << "/" << opts.passes << ":\n";
                std::cerr << "  Smoothed: " << report.applied << "\n";
                if (report.skipped > 0) {
                    std::cerr << "  Skipped (insufficient data): " << report.skipped << "\n";
                }
                std::cerr << "  Mean loops: " << std::fixed << std::setprecision(2)
                          << report.average_loops() << std::defaultfloat
                          << " (" << report.converged << " converged)\n";
                std::cerr << "  Log phases: " << report.phases.detected << " detected, "
                          << report.phases.cleared << " cleared\n";
                std::cerr << "  Time: "
                          << log_utils::format_elapsed(t_pass, std::chrono::steady_clock::now())
                          << "\n";
            }
        }

        SmoothedCurvesPayload payload = workspace.build_payload();

        if (opts.with_bands) {
            auto t_bands = std::chrono::steady_clock::now();
            size_t unavailable = 0;
            for (const auto& name : ids) {
                auto band = workspace.compute_band(name, opts.band);
                if (band) {
                    payload.bands.push_back(std::move(*band));
                } else {
                    unavailable++;
                }
            }
            if (opts.verbose) {
                std::cerr << "Bands (" << band_mode_to_string(opts.band.mode) << "): "
                          << payload.bands.size() << " computed, "
                          << unavailable << " unavailable ("
                          << log_utils::format_elapsed(t_bands, std::chrono::steady_clock::now())
                          << ")\n";
            }
            if (!opts.bands_file.empty()) {
                OutputStream bands_out(opts.bands_file);
                write_bands_tsv(bands_out.get(), payload.bands);
                bands_out.finish();
            }
        }

        OutputStream out(opts.output_file);
        write_payload_json(out.get(), payload);
        out.finish();

        if (opts.verbose) {
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
    struct SmoothRegistrar {
        SmoothRegistrar() {
            SubcommandRegistry::instance().register_command(
                "smooth",
                "Smooth curves, detect log phases, write JSON payload",
                cmd_smooth, 10);
        }
    } smooth_registrar;
}

}  // namespace cli
}  // namespace growthfit
