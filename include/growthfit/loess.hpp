#pragma once

/**
 * @file loess.hpp
 * @brief Robust locally weighted polynomial regression (LOESS)
 *
 * For every input x the k nearest points (by |x - x0|, ties by ascending
 * input index) are fitted with a weighted least-squares polynomial of degree
 * 1 or 2 and the fit is evaluated at x0. Weights are tricube in the scaled
 * distance d/dmax. Passes after the first multiply the tricube weights by
 * bisquare robustness weights computed from the previous residuals, scaled
 * by 6 * median(|residual|) (Cleveland 1979).
 *
 * The smoother is a pure function: no RNG, no shared state.
 */

#include "growthfit/types.hpp"

#include <cstddef>
#include <vector>

namespace growthfit {

struct LoessOptions {
    double span = 60.0;
    int degree = 1;
    int robust_iterations = 3;
};

struct LoessResult {
    std::vector<Point> points;  // ascending x, one per finite input point
    LoessDiagnostics diagnostics;
};

// k = ceil(span*n) for span <= 1, round(span) otherwise; clamped to [degree+1, n].
size_t loess_window_size(double span, size_t n, int degree);

// Throws InvalidParameter for bad options and InsufficientData when fewer
// than degree+1 finite points are supplied. Non-finite points are dropped;
// output is sorted by x (stable, so equal x keep input order).
LoessResult loess_smooth(const std::vector<Point>& points, const LoessOptions& opts);

}  // namespace growthfit
