#pragma once
// Convergence driver around the LOESS smoother.
//
// Re-runs the smoother up to max_refinements times on the same input and
// stops once two successive outputs differ by at most the tolerance
// (max pointwise |y_new - y_prev|). The first run has nothing to compare
// against, so it can never report convergence.

#include "growthfit/loess.hpp"
#include "growthfit/types.hpp"

#include <functional>
#include <limits>
#include <vector>

namespace growthfit {

struct RefinementResult {
    LoessResult result;        // output of the last run
    int loops = 0;             // runs actually performed, <= max_refinements
    bool converged = false;
    double last_max_diff = std::numeric_limits<double>::infinity();
};

// Called after every run with (loop, max_diff); max_diff is +inf on loop 1.
using RefinementProgressCallback = std::function<void(int, double)>;

// Validates params (InvalidParameter) and propagates InsufficientData.
RefinementResult refine(const std::vector<Point>& points,
                        const SmoothingParameters& params,
                        const RefinementProgressCallback& progress = nullptr);

}  // namespace growthfit
