#ifndef GROWTHFIT_CLI_COMMON_HPP
#define GROWTHFIT_CLI_COMMON_HPP

#include "args.hpp"
#include "growthfit/curve_workspace.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace growthfit {
namespace cli {

// Applies -t/--threads; returns the thread count in effect.
int setup_threads(int requested);

// Reads the input table into a fresh workspace configured from opts.
CurveWorkspace load_workspace(const Options& opts);

// Progress printer for batch operations (no-op unless verbose).
SampleProgressCallback progress_printer(bool verbose);

// File when a path is given, std::cout otherwise.
class OutputStream {
public:
    explicit OutputStream(const std::string& path);

    std::ostream& get() { return file_ ? *file_ : std::cout; }

    // Flushes and reports write failures (std::runtime_error).
    void finish();

private:
    std::string path_;
    std::unique_ptr<std::ofstream> file_;
};

}  // namespace cli
}  // namespace growthfit

#endif  // GROWTHFIT_CLI_COMMON_HPP
