#ifndef GROWTHFIT_CLI_ARGS_HPP
#define GROWTHFIT_CLI_ARGS_HPP

#include "growthfit/bootstrap_band.hpp"
#include "growthfit/log_phase.hpp"
#include "growthfit/types.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace growthfit {
namespace cli {

// Thrown by parse_args instead of calling exit(): 0 for --help/--version,
// 1 for usage errors (message already formatted for stderr).
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& msg = "")
        : std::runtime_error(msg), exit_code_(code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct Options {
    std::string command;          // smooth, band, log-phase
    std::string input_file;
    std::string output_file;      // empty = stdout
    std::string bands_file;       // smooth: also write band TSV here
    SmoothingParameters smoothing;
    LogPhaseDetectionOptions detection;
    BandOptions band;
    bool with_bands = false;      // smooth: embed bands in the JSON payload
    int passes = 1;               // smooth: successive apply operations
    int num_threads = 0;          // 0 = OpenMP default
    bool verbose = false;
};

void print_version();

// Usage for one subcommand, to stdout.
void print_usage(const std::string& command);

// argv[0] is the subcommand name (as handed over by the dispatcher).
// Throws ParseArgsExit for --help, --version and any usage error.
Options parse_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace growthfit

#endif  // GROWTHFIT_CLI_ARGS_HPP
