#include "args.hpp"
#include "growthfit/version.h"

#include <cmath>
#include <iostream>
#include <string>

namespace growthfit {
namespace cli {

void print_version() {
    std::cout << "growthfit " << GROWTHFIT_VERSION << "\n";
}

void print_usage(const std::string& command) {
    std::cout << "growthfit v" << GROWTHFIT_VERSION << "\n\n";
    std::cout << "Usage: growthfit " << command << " -i <curves.tsv[.gz]> [-o <output>] [options]\n\n";
    if (command == "smooth") {
        std::cout << "Smooth every sample, detect log phases and write the JSON payload.\n\n";
    } else if (command == "band") {
        std::cout << "Bootstrap uncertainty bands for samples with >= 2 replicate wells (TSV).\n\n";
    } else if (command == "log-phase") {
        std::cout << "Smooth every sample once and write detected log phases (TSV).\n\n";
    }
    std::cout << "Input:\n";
    std::cout << "  -i, --input <file>       Long table: sample, well, replicate, time_min, value [, color]\n";
    std::cout << "  -o, --output <file>      Output file (default: stdout)\n";
    std::cout << "\nSmoothing:\n";
    std::cout << "  --span <float>           <=1: fraction of points, >1: window size (default: 60)\n";
    std::cout << "  --degree <int>           Local polynomial degree, 1 or 2 (default: 1)\n";
    std::cout << "  --robust-iters <int>     Robustness passes incl. the first (default: 3)\n";
    std::cout << "  --max-refinements <int>  Convergence re-runs (default: 3)\n";
    std::cout << "  --tol <float>            Convergence tolerance (default: 1e-4)\n";
    if (command == "smooth") {
        std::cout << "  --passes <int>           Apply smoothing N times (default: 1)\n";
    }
    std::cout << "\nLog phase:\n";
    std::cout << "  --log-window <int>       Points per regression window (default: 20)\n";
    std::cout << "  --r2-min <float>         Minimum window R^2 (default: 0.98)\n";
    std::cout << "  --od-min <float>         Ignore values below this (default: 0.001)\n";
    std::cout << "  --frac-k-max <float>     Reject windows above this fraction of K (default: 0.9)\n";
    std::cout << "  --mu-rel-min <float>     Minimum slope / mu_max (default: 0.5)\n";
    std::cout << "  --mu-rel-max <float>     Maximum slope / mu_max (default: 1.05)\n";
    std::cout << "\nBands:\n";
    std::cout << "  --band-mode <mode>       none, pointwise, simultaneous (default: pointwise)\n";
    std::cout << "  --max-exact <int>        Largest well count enumerated exactly (default: 8)\n";
    std::cout << "  --resamples <int>        Monte-Carlo draws above --max-exact (default: 2000)\n";
    std::cout << "  --seed <int>             Monte-Carlo seed (default: 42)\n";
    if (command == "smooth") {
        std::cout << "  --bands <file>           Also write bands as TSV\n";
    }
    std::cout << "\n";
    std::cout << "  -t, --threads <int>      Number of threads (default: auto)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    opts.command = argc > 0 ? argv[0] : "";
    bool band_mode_given = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_size = [&](const std::string& flag, const std::string& value) -> size_t {
            try {
                size_t idx = 0;
                if (!value.empty() && value[0] == '-') {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                size_t parsed = std::stoull(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_double = [&](const std::string& flag, const std::string& value) -> double {
            try {
                size_t idx = 0;
                double parsed = std::stod(value, &idx);
                if (idx != value.size() || !std::isfinite(parsed)) {
                    throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(opts.command);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--input") {
            opts.input_file = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "--span") {
            opts.smoothing.span = parse_double(arg, require_value(arg));
        } else if (arg == "--degree") {
            opts.smoothing.degree = parse_int(arg, require_value(arg));
        } else if (arg == "--robust-iters") {
            opts.smoothing.robust_iterations = parse_int(arg, require_value(arg));
        } else if (arg == "--max-refinements") {
            opts.smoothing.max_refinements = parse_int(arg, require_value(arg));
        } else if (arg == "--tol") {
            opts.smoothing.convergence_tolerance = parse_double(arg, require_value(arg));
        } else if (arg == "--passes") {
            opts.passes = parse_int(arg, require_value(arg));
            if (opts.passes < 1) {
                throw ParseArgsExit(1, "Error: --passes must be >= 1");
            }
        } else if (arg == "--log-window") {
            opts.detection.window_size = parse_int(arg, require_value(arg));
        } else if (arg == "--r2-min") {
            opts.detection.r2_min = parse_double(arg, require_value(arg));
        } else if (arg == "--od-min") {
            opts.detection.od_min = parse_double(arg, require_value(arg));
        } else if (arg == "--frac-k-max") {
            opts.detection.frac_k_max = parse_double(arg, require_value(arg));
        } else if (arg == "--mu-rel-min") {
            opts.detection.mu_rel_min = parse_double(arg, require_value(arg));
        } else if (arg == "--mu-rel-max") {
            opts.detection.mu_rel_max = parse_double(arg, require_value(arg));
        } else if (arg == "--band-mode") {
            std::string value = require_value(arg);
            if (!parse_band_mode(value, opts.band.mode)) {
                throw ParseArgsExit(1, "Error: Invalid --band-mode: " + value +
                                       " (expected none, pointwise or simultaneous)");
            }
            band_mode_given = true;
        } else if (arg == "--max-exact") {
            opts.band.max_exact_replicates = parse_size(arg, require_value(arg));
            if (opts.band.max_exact_replicates < 1) {
                throw ParseArgsExit(1, "Error: --max-exact must be >= 1");
            }
        } else if (arg == "--resamples") {
            opts.band.monte_carlo_resamples = parse_size(arg, require_value(arg));
            if (opts.band.monte_carlo_resamples < 1) {
                throw ParseArgsExit(1, "Error: --resamples must be >= 1");
            }
        } else if (arg == "--seed") {
            opts.band.seed = static_cast<uint64_t>(parse_size(arg, require_value(arg)));
        } else if (arg == "--bands") {
            opts.bands_file = require_value(arg);
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.input_file.empty()) {
        throw ParseArgsExit(1, "Error: --input is required");
    }

    try {
        validate(opts.smoothing);
    } catch (const InvalidParameter& e) {
        throw ParseArgsExit(1, std::string("Error: ") + e.what());
    }

    if (opts.command == "band" && opts.band.mode == BandMode::NONE) {
        throw ParseArgsExit(1, "Error: --band-mode none leaves nothing to compute");
    }
    if (opts.command == "smooth") {
        opts.with_bands = opts.band.mode != BandMode::NONE &&
                          (band_mode_given || !opts.bands_file.empty());
    }

    return opts;
}

}  // namespace cli
}  // namespace growthfit
