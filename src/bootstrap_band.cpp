/**
 * @file bootstrap_band.cpp
 * @brief Exact combinatorial bootstrap bands over replicate wells
 */

#include "growthfit/bootstrap_band.hpp"
#include "growthfit/refinement.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <utility>

namespace growthfit {

namespace {

double factorial(uint32_t k) {
    double out = 1.0;
    for (uint32_t i = 2; i <= k; ++i) out *= static_cast<double>(i);
    return out;
}

void enumerate_rec(size_t idx, uint32_t remaining, std::vector<uint32_t>& acc,
                   std::vector<std::vector<uint32_t>>& out) {
    const size_t n = acc.size();
    if (idx == n - 1) {
        acc[idx] = remaining;
        out.push_back(acc);
        return;
    }
    for (uint32_t k = 0; k <= remaining; ++k) {
        acc[idx] = k;
        enumerate_rec(idx + 1, remaining - k, acc, out);
    }
}

std::vector<Point> pseudo_replicate(const std::vector<ReplicateWell>& wells,
                                    const std::vector<uint32_t>& counts) {
    size_t total = 0;
    for (size_t i = 0; i < wells.size(); ++i) total += counts[i] * wells[i].points.size();
    std::vector<Point> pts;
    pts.reserve(total);
    for (size_t i = 0; i < wells.size(); ++i) {
        for (uint32_t copy = 0; copy < counts[i]; ++copy) {
            pts.insert(pts.end(), wells[i].points.begin(), wells[i].points.end());
        }
    }
    return pts;
}

std::vector<BandPoint> finite_only(std::vector<BandPoint> pts) {
    pts.erase(std::remove_if(pts.begin(), pts.end(), [](const BandPoint& p) {
                  return !std::isfinite(p.x) || !std::isfinite(p.low) || !std::isfinite(p.high);
              }),
              pts.end());
    return pts;
}

}  // namespace

const char* band_mode_to_string(BandMode mode) {
    switch (mode) {
        case BandMode::POINTWISE: return "pointwise";
        case BandMode::SIMULTANEOUS: return "simultaneous";
        default: return "none";
    }
}

const char* band_source_to_string(BandSource source) {
    switch (source) {
        case BandSource::BOOTSTRAP: return "bootstrap";
        case BandSource::WELL_SPREAD: return "well_spread";
        default: return "degenerate";
    }
}

bool parse_band_mode(const std::string& text, BandMode& mode) {
    if (text == "none") {
        mode = BandMode::NONE;
    } else if (text == "pointwise") {
        mode = BandMode::POINTWISE;
    } else if (text == "simultaneous") {
        mode = BandMode::SIMULTANEOUS;
    } else {
        return false;
    }
    return true;
}

std::vector<Composition> enumerate_compositions(size_t n) {
    std::vector<Composition> out;
    if (n == 0) return out;

    std::vector<std::vector<uint32_t>> all;
    std::vector<uint32_t> acc(n, 0);
    enumerate_rec(0, static_cast<uint32_t>(n), acc, all);

    const double n_fact = factorial(static_cast<uint32_t>(n));
    const double norm = std::pow(static_cast<double>(n), static_cast<double>(n));
    out.reserve(all.size());
    for (auto& counts : all) {
        double denom = 1.0;
        for (uint32_t c : counts) denom *= factorial(c);
        Composition comp;
        comp.weight = (n_fact / denom) / norm;
        comp.counts = std::move(counts);
        out.push_back(std::move(comp));
    }
    return out;
}

std::vector<Composition> sample_compositions(size_t n, size_t draws, uint64_t seed) {
    std::vector<Composition> out;
    if (n == 0 || draws == 0) return out;

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, n - 1);
    const double w = 1.0 / static_cast<double>(draws);
    out.reserve(draws);
    for (size_t d = 0; d < draws; ++d) {
        Composition comp;
        comp.counts.assign(n, 0);
        for (size_t k = 0; k < n; ++k) comp.counts[pick(rng)]++;
        comp.weight = w;
        out.push_back(std::move(comp));
    }
    return out;
}

double weighted_percentile(const std::vector<double>& values,
                           const std::vector<double>& weights,
                           double p) {
    std::vector<std::pair<double, double>> paired;
    paired.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        double w = i < weights.size() ? weights[i] : 0.0;
        if (std::isfinite(values[i]) && w > 0.0) paired.emplace_back(values[i], w);
    }
    if (paired.empty()) return std::numeric_limits<double>::quiet_NaN();

    std::stable_sort(paired.begin(), paired.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    double total = 0.0;
    for (const auto& item : paired) total += item.second;
    const double target = (p / 100.0) * total;
    double acc = 0.0;
    for (const auto& item : paired) {
        acc += item.second;
        if (acc >= target) return item.first;
    }
    return paired.back().first;
}

std::vector<double> interpolate_clamped(const std::vector<Point>& curve,
                                        const std::vector<double>& xs) {
    std::vector<Point> sorted = finite_sorted(curve);
    std::vector<double> out(xs.size(), std::numeric_limits<double>::quiet_NaN());
    if (sorted.empty()) return out;

    for (size_t i = 0; i < xs.size(); ++i) {
        const double x = xs[i];
        if (x <= sorted.front().x) {
            out[i] = sorted.front().y;
            continue;
        }
        if (x >= sorted.back().x) {
            out[i] = sorted.back().y;
            continue;
        }
        auto it = std::upper_bound(sorted.begin(), sorted.end(), x,
                                   [](double v, const Point& p) { return v < p.x; });
        const Point& b = *it;
        const Point& a = *(it - 1);
        const double t = (x - a.x) / (b.x - a.x);
        out[i] = a.y * (1.0 - t) + b.y * t;
    }
    return out;
}

std::optional<BandResult> estimate_band(const std::string& sample,
                                        const std::vector<Point>& raw_points,
                                        const std::vector<ReplicateWell>& wells,
                                        const SmoothingParameters& params,
                                        const BandOptions& options) {
    if (options.mode == BandMode::NONE) {
        throw InvalidParameter("Band mode 'none' does not produce a band");
    }
    validate(params);
    if (wells.size() < 2) return std::nullopt;

    BandResult out;
    out.band.sample = sample;

    for (const auto& well : wells) {
        for (const auto& p : well.points) {
            if (std::isfinite(p.x)) out.grid.push_back(p.x);
        }
    }
    std::sort(out.grid.begin(), out.grid.end());
    out.grid.erase(std::unique(out.grid.begin(), out.grid.end()), out.grid.end());
    if (out.grid.empty()) return std::nullopt;
    const std::vector<double>& grid = out.grid;

    try {
        RefinementResult main_fit = refine(raw_points, params);
        out.main_prediction = interpolate_clamped(main_fit.result.points, grid);
    } catch (const InsufficientData&) {
        return std::nullopt;
    }
    const std::vector<double>& main_pred = out.main_prediction;

    const size_t n = wells.size();
    std::vector<Composition> comps;
    if (n <= options.max_exact_replicates) {
        comps = enumerate_compositions(n);
        out.exact = true;
    } else {
        comps = sample_compositions(n, options.monte_carlo_resamples, options.seed);
        out.exact = false;
    }
    out.compositions = comps.size();

    // Compositions are independent; results land in per-composition slots
    // and are aggregated below in enumeration order.
    std::vector<std::vector<double>> preds(comps.size());
    std::vector<uint8_t> evaluated(comps.size(), 0);
    const long n_comps = static_cast<long>(comps.size());

    #pragma omp parallel for schedule(dynamic, 1)
    for (long c = 0; c < n_comps; ++c) {
        const Composition& comp = comps[static_cast<size_t>(c)];
        if (!(comp.weight > 0.0)) continue;
        std::vector<Point> pts = pseudo_replicate(wells, comp.counts);
        if (pts.empty()) continue;
        try {
            RefinementResult fit = refine(pts, params);
            preds[static_cast<size_t>(c)] = interpolate_clamped(fit.result.points, grid);
            evaluated[static_cast<size_t>(c)] = 1;
        } catch (const InsufficientData&) {
            // counted below
        }
    }

    std::vector<std::vector<double>> values_by_t(grid.size());
    std::vector<std::vector<double>> weights_by_t(grid.size());
    std::vector<double> diff_values;
    std::vector<double> diff_weights;

    for (size_t c = 0; c < comps.size(); ++c) {
        if (!evaluated[c]) {
            out.skipped++;
            continue;
        }
        const std::vector<double>& pred = preds[c];
        double max_diff = 0.0;
        for (size_t i = 0; i < grid.size(); ++i) {
            values_by_t[i].push_back(pred[i]);
            weights_by_t[i].push_back(comps[c].weight);
            max_diff = std::max(max_diff, std::abs(pred[i] - main_pred[i]));
        }
        diff_values.push_back(max_diff);
        diff_weights.push_back(comps[c].weight);
    }

    std::vector<BandPoint> band(grid.size());
    if (options.mode == BandMode::POINTWISE) {
        for (size_t i = 0; i < grid.size(); ++i) {
            band[i].x = grid[i];
            band[i].low = weighted_percentile(values_by_t[i], weights_by_t[i], 2.5);
            band[i].high = weighted_percentile(values_by_t[i], weights_by_t[i], 97.5);
        }
    } else {
        const double c = weighted_percentile(diff_values, diff_weights, 95.0);
        for (size_t i = 0; i < grid.size(); ++i) {
            band[i] = BandPoint{grid[i], main_pred[i] - c, main_pred[i] + c};
        }
    }

    out.source = BandSource::BOOTSTRAP;
    out.band.points = finite_only(std::move(band));

    if (out.band.points.empty()) {
        std::vector<std::vector<double>> per_well;
        per_well.reserve(wells.size());
        for (const auto& well : wells) per_well.push_back(interpolate_clamped(well.points, grid));

        for (size_t i = 0; i < grid.size(); ++i) {
            std::vector<double> vals;
            for (const auto& row : per_well) {
                if (std::isfinite(row[i])) vals.push_back(row[i]);
            }
            if (vals.size() < 2) continue;
            double mean = 0.0;
            for (double v : vals) mean += v;
            mean /= static_cast<double>(vals.size());
            double ss = 0.0;
            for (double v : vals) ss += (v - mean) * (v - mean);
            const double sd = std::sqrt(std::max(0.0, ss / static_cast<double>(vals.size() - 1)));
            out.band.points.push_back(BandPoint{grid[i], mean - sd, mean + sd});
        }
        out.band.points = finite_only(std::move(out.band.points));
        out.source = BandSource::WELL_SPREAD;
    }

    if (out.band.points.empty()) {
        for (size_t i = 0; i < grid.size(); ++i) {
            out.band.points.push_back(BandPoint{grid[i], main_pred[i], main_pred[i]});
        }
        out.band.points = finite_only(std::move(out.band.points));
        out.source = BandSource::DEGENERATE;
    }

    if (out.band.points.empty()) return std::nullopt;
    return out;
}

}  // namespace growthfit
