// growthfit band: bootstrap uncertainty bands across replicate wells
//
// Every sample with at least two wells gets a band on the union of its
// measurement times. Up to --max-exact wells the bootstrap distribution is
// enumerated exactly; above that --resamples seeded draws are used.

#include "subcommand.hpp"
#include "args.hpp"
#include "common.hpp"
#include "growthfit/log_utils.hpp"
#include "growthfit/payload_writer.hpp"

#include <chrono>
#include <iostream>

namespace growthfit {
namespace cli {

int cmd_band(int argc, char* argv[]) {
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

        CurveWorkspace workspace = load_workspace(opts);

        if (opts.verbose) {
            std::cerr << "Uncertainty bands (" << band_mode_to_string(opts.band.mode) << ")\n";
            std::cerr << "  Exact up to " << opts.band.max_exact_replicates << " wells, then "
                      << opts.band.monte_carlo_resamples << " draws (seed "
                      << opts.band.seed << ")\n";
            std::cerr << "  Threads: " << num_threads << "\n";
        }

        std::vector<BandResult> bands;
        const auto& samples = workspace.samples();
        for (size_t i = 0; i < samples.size(); ++i) {
            const Sample& sample = samples[i];
            auto band = workspace.compute_band(sample.name, opts.band);
            if (opts.verbose) {
                std::cerr << log_utils::format_progress(i + 1, samples.size(), sample.name);
                if (band) {
                    std::cerr << ": " << band_source_to_string(band->source)
                              << ", " << band->compositions << " compositions"
                              << (band->exact ? "" : " (sampled)");
                    if (band->skipped > 0) std::cerr << ", " << band->skipped << " skipped";
                } else {
                    std::cerr << ": unavailable (" << sample.wells.size() << " wells)";
                }
                std::cerr << "\n";
            }
            if (band) bands.push_back(std::move(*band));
        }

        OutputStream out(opts.output_file);
        write_bands_tsv(out.get(), bands);
        out.finish();

        if (opts.verbose) {
            std::cerr << "Bands written: " << bands.size() << "/" << samples.size() << "\n";
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
    struct BandRegistrar {
        BandRegistrar() {
            SubcommandRegistry::instance().register_command(
                "band",
                "Bootstrap uncertainty bands across replicate wells",
                cmd_band, 20);
        }
    } band_registrar;
}

}  // namespace cli
}  // namespace growthfit
