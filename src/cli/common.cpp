#include "common.hpp"
#include "growthfit/curve_reader.hpp"
#include "growthfit/log_utils.hpp"

#include <chrono>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace growthfit {
namespace cli {

int setup_threads(int requested) {
    int num_threads = requested;
#ifdef _OPENMP
    if (num_threads <= 0) {
        num_threads = omp_get_max_threads();
    }
    omp_set_num_threads(num_threads);
#else
    num_threads = 1;
#endif
    return num_threads;
}

CurveWorkspace load_workspace(const Options& opts) {
    auto t_start = std::chrono::steady_clock::now();

    CurveTable table = read_curve_table(opts.input_file);

    WorkspaceConfig config;
    config.smoothing = opts.smoothing;
    config.detection = opts.detection;
    config.auto_phase = AutoPhasePolicy::PRESERVE_MANUAL;
    CurveWorkspace workspace(config);

    const size_t rows = table.rows;
    const size_t dropped = table.dropped;
    load_into(workspace, std::move(table));

    if (opts.verbose) {
        size_t wells = 0;
        for (const auto& s : workspace.samples()) wells += s.wells.size();
        std::cerr << "Loaded " << opts.input_file << ":\n";
        std::cerr << "  Samples: " << workspace.size() << "\n";
        std::cerr << "  Wells: " << wells << "\n";
        std::cerr << "  Rows: " << rows;
        if (dropped > 0) std::cerr << " (" << dropped << " non-finite dropped)";
        std::cerr << "\n";
        std::cerr << "  Load time: "
                  << log_utils::format_elapsed(t_start, std::chrono::steady_clock::now()) << "\n";
    }
    return workspace;
}

SampleProgressCallback progress_printer(bool verbose) {
    if (!verbose) return nullptr;
    return [](size_t done, size_t total, const std::string& sample) {
        std::cerr << log_utils::format_progress(done, total, sample) << "\n";
    };
}

OutputStream::OutputStream(const std::string& path) : path_(path) {
    if (path_.empty() || path_ == "-") return;
    file_ = std::make_unique<std::ofstream>(path_);
    if (!*file_) {
        throw std::runtime_error("Cannot open output file: " + path_);
    }
}

void OutputStream::finish() {
    std::ostream& out = get();
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing " + (file_ ? path_ : std::string("stdout")));
    }
}

}  // namespace cli
}  // namespace growthfit
