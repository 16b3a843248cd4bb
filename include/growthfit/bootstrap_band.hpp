#pragma once

/**
 * @file bootstrap_band.hpp
 * @brief Uncertainty bands for a smoothed sample from its replicate wells
 *
 * The bootstrap distribution of an n-draw resample of n equally likely wells
 * is enumerated exactly: every composition counts[0..n-1] with sum n is
 * visited once and weighted by its multinomial mass
 *
 *     n! / (prod counts_i!) / n^n
 *
 * Each composition is turned into a pseudo-replicate (well i repeated
 * counts[i] times), re-smoothed, and interpolated onto the shared time grid.
 *
 * The number of compositions is C(2n-1, n): 3 for n=2, 126 for n=5,
 * 6435 for n=8, 92378 for n=10. Exact enumeration is therefore limited to
 * n <= BandOptions::max_exact_replicates; above that a seeded Monte-Carlo
 * sample of monte_carlo_resamples compositions is used instead.
 *
 * Fallback chain when the bootstrap yields no finite grid point:
 *   1. bootstrap band
 *   2. per-well curves on the grid, mean +/- sample SD (>= 2 finite values)
 *   3. zero-width band at the main fit
 */

#include "growthfit/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace growthfit {

enum class BandMode {
    NONE,
    POINTWISE,     // weighted 2.5/97.5 percentiles at each grid time
    SIMULTANEOUS   // main fit +/- weighted 95th percentile of max deviation
};

enum class BandSource {
    BOOTSTRAP,
    WELL_SPREAD,
    DEGENERATE
};

const char* band_mode_to_string(BandMode mode);
const char* band_source_to_string(BandSource source);

// Accepts "none", "pointwise", "simultaneous". Returns false otherwise.
bool parse_band_mode(const std::string& text, BandMode& mode);

struct BandOptions {
    BandMode mode = BandMode::POINTWISE;
    size_t max_exact_replicates = 8;     // exact enumeration boundary
    size_t monte_carlo_resamples = 2000; // draws beyond the boundary
    uint64_t seed = 42;
};

struct Composition {
    std::vector<uint32_t> counts;  // draws per well, sum == n
    double weight = 0.0;
};

struct BandResult {
    UncertaintyBand band;
    BandSource source = BandSource::BOOTSTRAP;
    bool exact = true;               // false when Monte-Carlo was used
    size_t compositions = 0;         // compositions considered
    size_t skipped = 0;              // compositions with insufficient data
    std::vector<double> grid;
    std::vector<double> main_prediction;
};

// All compositions of n draws over n wells, in lexicographic order.
std::vector<Composition> enumerate_compositions(size_t n);

// `draws` multinomial resamples from a seeded mt19937_64, weight 1/draws each.
std::vector<Composition> sample_compositions(size_t n, size_t draws, uint64_t seed);

// First value (ascending) whose cumulative weight reaches p/100 of the total.
// Non-finite values and non-positive weights are ignored; NaN when none remain.
double weighted_percentile(const std::vector<double>& values,
                           const std::vector<double>& weights,
                           double p);

// Linear interpolation of a curve at xs, clamped to the end values.
std::vector<double> interpolate_clamped(const std::vector<Point>& curve,
                                        const std::vector<double>& xs);

// Returns std::nullopt ("unavailable") for fewer than two wells, an empty
// grid, or a main fit with insufficient data. Throws InvalidParameter for
// BandMode::NONE or invalid smoothing parameters.
std::optional<BandResult> estimate_band(const std::string& sample,
                                        const std::vector<Point>& raw_points,
                                        const std::vector<ReplicateWell>& wells,
                                        const SmoothingParameters& params,
                                        const BandOptions& options);

}  // namespace growthfit
