#pragma once
// Exponential (log) growth phase detection
//
// A window of `window_size` consecutive points (time order, after dropping
// points below od_min or <= 0) is fitted by OLS of ln(y) on t. A window is
// accepted when
//   - its largest value stays below frac_k_max * K, where K (carrying
//     capacity) is the median of the last five filtered values,
//   - slope > 0 and r2 >= r2_min,
//   - mu_rel_min <= slope / mu_max <= mu_rel_max, with mu_max the steepest
//     window that passed the first two tests.
// Accepted windows are merged into runs of contiguous points and the run
// with the longest time extent wins (ties: earliest start, then more points).

#include "growthfit/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace growthfit {

struct LogPhaseDetectionOptions {
    int window_size = 20;      // points per regression window, >= 2
    double r2_min = 0.98;      // [0.1, 0.9999]
    double od_min = 0.001;     // >= 0
    double frac_k_max = 0.9;   // [0.05, 0.95]
    double mu_rel_min = 0.5;   // >= 0.1
    double mu_rel_max = 1.05;  // >= mu_rel_min + 1e-3
};

// Clamp free-text style options into their documented ranges. Non-finite
// fields fall back to the defaults.
LogPhaseDetectionOptions clamp_detection_options(const LogPhaseDetectionOptions& options);

struct LineFit {
    double slope = 0.0;
    double intercept = 0.0;
    double r2 = 0.0;
};

// OLS of ys on xs. False when n < 2 or xs has no spread.
bool fit_line(const std::vector<double>& xs, const std::vector<double>& ys, LineFit& fit);

struct GrowthWindow {
    double start_time = 0.0;
    double end_time = 0.0;
    double slope = 0.0;  // mu, per minute
    double r2 = 0.0;
    double mu_rel = 0.0;
};

struct LogPhaseDetection {
    std::vector<size_t> indices;       // positions in the caller's point sequence
    std::optional<double> start_time;
    std::optional<double> end_time;
    std::optional<double> mu_max;
    std::optional<double> mu_mean;
    std::optional<double> k_estimate;
    std::optional<LineFit> fit;        // ln(y) ~ t over the selected run
    std::optional<double> mu_rel;      // fit->slope / mu_max
    size_t windows_evaluated = 0;
    std::vector<GrowthWindow> windows; // windows that passed every filter

    bool detected() const {
        return !indices.empty() && start_time.has_value() && end_time.has_value();
    }
};

// Never throws on data; "no log phase" is an empty result.
LogPhaseDetection detect_log_phase(const std::vector<Point>& points,
                                   const LogPhaseDetectionOptions& options = {});

}  // namespace growthfit
