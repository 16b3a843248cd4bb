/**
 * @file loess.cpp
 * @brief LOESS smoother with bisquare robustness passes
 */

#include "growthfit/loess.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>

namespace growthfit {

namespace {

constexpr double EPS = 1e-12;

double median_of(std::vector<double> values) {
    if (values.empty()) return 0.0;
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) return upper;
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return 0.5 * (lower + upper);
}

// Sorted view of the input. order[i] is the input position of sorted point i.
struct SortedPoints {
    std::vector<double> x;
    std::vector<double> y;
    std::vector<size_t> order;
};

SortedPoints sort_finite(const std::vector<Point>& points) {
    SortedPoints s;
    std::vector<size_t> idx;
    idx.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        if (is_finite(points[i])) idx.push_back(i);
    }
    std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        return points[a].x < points[b].x;
    });
    s.x.reserve(idx.size());
    s.y.reserve(idx.size());
    for (size_t i : idx) {
        s.x.push_back(points[i].x);
        s.y.push_back(points[i].y);
    }
    s.order = std::move(idx);
    return s;
}

// The k nearest neighbours of sorted point i. Points tied at the k-th
// distance are taken in ascending input order.
void select_neighbours(const SortedPoints& s, size_t i, size_t k,
                       std::vector<size_t>& out, std::vector<size_t>& ties) {
    const size_t n = s.x.size();
    out.clear();
    if (k >= n) {
        out.resize(n);
        std::iota(out.begin(), out.end(), size_t{0});
        return;
    }

    const double x0 = s.x[i];
    auto dist = [&](size_t j) { return std::abs(s.x[j] - x0); };
    const double inf = std::numeric_limits<double>::infinity();

    // Grow a contiguous window around i; the sorted order makes it the
    // k smallest distances as a multiset.
    size_t lo = i, hi = i;
    double kth = 0.0;
    while (hi - lo + 1 < k) {
        double dl = lo > 0 ? dist(lo - 1) : inf;
        double dr = hi + 1 < n ? dist(hi + 1) : inf;
        if (dl <= dr) {
            --lo;
            kth = std::max(kth, dl);
        } else {
            ++hi;
            kth = std::max(kth, dr);
        }
    }

    // Everything at exactly the k-th distance, possibly outside the window.
    while (lo > 0 && dist(lo - 1) == kth) --lo;
    while (hi + 1 < n && dist(hi + 1) == kth) ++hi;

    ties.clear();
    for (size_t j = lo; j <= hi; ++j) {
        if (dist(j) < kth) {
            out.push_back(j);
        } else {
            ties.push_back(j);
        }
    }
    const size_t need = k - out.size();
    if (ties.size() > need) {
        std::sort(ties.begin(), ties.end(), [&](size_t a, size_t b) {
            return s.order[a] < s.order[b];
        });
        ties.resize(need);
    }
    out.insert(out.end(), ties.begin(), ties.end());
}

// Gaussian elimination with partial pivoting on a (order x order+1) system.
template <size_t N>
bool solve_normal_equations(std::array<std::array<double, N + 1>, N>& aug, size_t order,
                            std::array<double, N>& solution) {
    for (size_t col = 0; col < order; ++col) {
        size_t pivot_row = col;
        for (size_t r = col + 1; r < order; ++r) {
            if (std::abs(aug[r][col]) > std::abs(aug[pivot_row][col])) pivot_row = r;
        }
        double pivot = aug[pivot_row][col];
        if (std::abs(pivot) < EPS) return false;
        if (pivot_row != col) std::swap(aug[pivot_row], aug[col]);
        for (size_t c = col; c <= order; ++c) aug[col][c] /= pivot;
        for (size_t r = 0; r < order; ++r) {
            if (r == col) continue;
            double factor = aug[r][col];
            if (std::abs(factor) < EPS) continue;
            for (size_t c = col; c <= order; ++c) aug[r][c] -= factor * aug[col][c];
        }
    }
    for (size_t r = 0; r < order; ++r) solution[r] = aug[r][order];
    return true;
}

// Weighted least squares in the centred, scaled coordinate u = (x - x0)/scale;
// the fitted value at x0 is the intercept.
bool fit_local_polynomial(const SortedPoints& s, const std::vector<size_t>& nbrs,
                          const std::vector<double>& weights, int degree,
                          double x0, double scale, double& value) {
    const size_t order = static_cast<size_t>(degree) + 1;
    std::array<std::array<double, 4>, 3> aug = {};
    double weight_sum = 0.0;

    for (size_t j = 0; j < nbrs.size(); ++j) {
        const double w = weights[j];
        if (!(w > 0.0)) continue;
        weight_sum += w;
        const double u = (s.x[nbrs[j]] - x0) / scale;
        const std::array<double, 3> basis = {1.0, u, u * u};
        for (size_t r = 0; r < order; ++r) {
            for (size_t c = 0; c < order; ++c) {
                aug[r][c] += w * basis[r] * basis[c];
            }
            aug[r][order] += w * basis[r] * s.y[nbrs[j]];
        }
    }
    if (!(weight_sum > 0.0)) return false;

    std::array<double, 3> solution = {};
    if (order == 2) {
        std::array<std::array<double, 3>, 2> sys = {{
            {aug[0][0], aug[0][1], aug[0][2]},
            {aug[1][0], aug[1][1], aug[1][2]},
        }};
        std::array<double, 2> sol2 = {};
        if (!solve_normal_equations<2>(sys, 2, sol2)) return false;
        solution[0] = sol2[0];
    } else {
        std::array<std::array<double, 4>, 3> sys = aug;
        if (!solve_normal_equations<3>(sys, 3, solution)) return false;
    }
    if (!std::isfinite(solution[0])) return false;
    value = solution[0];
    return true;
}

bool weighted_mean(const SortedPoints& s, const std::vector<size_t>& nbrs,
                   const std::vector<double>& weights, double& value) {
    double total = 0.0;
    double acc = 0.0;
    for (size_t j = 0; j < nbrs.size(); ++j) {
        if (!(weights[j] > 0.0)) continue;
        total += weights[j];
        acc += weights[j] * s.y[nbrs[j]];
    }
    if (!(total > 0.0)) return false;
    value = acc / total;
    return true;
}

}  // namespace

size_t loess_window_size(double span, size_t n, int degree) {
    const size_t min_k = static_cast<size_t>(std::max(degree, 0)) + 1;
    if (n == 0) return 0;
    double raw;
    if (span <= 1.0) {
        // Tolerate products such as 0.7 * 10 landing a hair above 7.
        raw = std::ceil(span * static_cast<double>(n) - 1e-9);
    } else {
        raw = std::round(span);
    }
    raw = std::min(raw, static_cast<double>(n));
    size_t k = raw < 1.0 ? 1 : static_cast<size_t>(raw);
    k = std::max(k, std::min(min_k, n));
    return k;
}

LoessResult loess_smooth(const std::vector<Point>& points, const LoessOptions& opts) {
    if (!std::isfinite(opts.span) || opts.span <= 0.0) {
        std::ostringstream oss;
        oss << "LOESS span must be > 0 (got " << opts.span << ")";
        throw InvalidParameter(oss.str());
    }
    if (opts.degree != 1 && opts.degree != 2) {
        throw InvalidParameter("LOESS degree must be 1 or 2 (got " +
                               std::to_string(opts.degree) + ")");
    }
    if (opts.robust_iterations < 1) {
        throw InvalidParameter("LOESS robust iterations must be >= 1 (got " +
                               std::to_string(opts.robust_iterations) + ")");
    }

    SortedPoints s = sort_finite(points);
    const size_t n = s.x.size();
    const size_t required = static_cast<size_t>(opts.degree) + 1;
    if (n < required) {
        throw InsufficientData("LOESS needs at least " + std::to_string(required) +
                               " finite points, got " + std::to_string(n),
                               n, required);
    }

    const size_t k = loess_window_size(opts.span, n, opts.degree);

    std::vector<double> robustness(n, 1.0);
    std::vector<double> fitted(n, 0.0);
    std::vector<double> residuals(n, 0.0);
    std::vector<size_t> nbrs;
    std::vector<size_t> ties;
    std::vector<double> weights;
    nbrs.reserve(k);
    weights.reserve(k);

    for (int pass = 0; pass < opts.robust_iterations; ++pass) {
        for (size_t i = 0; i < n; ++i) {
            select_neighbours(s, i, k, nbrs, ties);
            const double x0 = s.x[i];

            double dmax = 0.0;
            for (size_t j : nbrs) dmax = std::max(dmax, std::abs(s.x[j] - x0));

            weights.resize(nbrs.size());
            for (size_t j = 0; j < nbrs.size(); ++j) {
                double tricube = 1.0;
                if (dmax > 0.0) {
                    double u = std::abs(s.x[nbrs[j]] - x0) / dmax;
                    double t = 1.0 - u * u * u;
                    tricube = t > 0.0 ? t * t * t : 0.0;
                }
                weights[j] = tricube * robustness[nbrs[j]];
            }

            double value = 0.0;
            const double scale = dmax > 0.0 ? dmax : 1.0;
            if (fit_local_polynomial(s, nbrs, weights, opts.degree, x0, scale, value) ||
                weighted_mean(s, nbrs, weights, value)) {
                fitted[i] = value;
            } else {
                // All weights vanished: keep the previous pass (or the observation).
                fitted[i] = pass == 0 ? s.y[i] : fitted[i];
            }
        }

        for (size_t i = 0; i < n; ++i) residuals[i] = s.y[i] - fitted[i];
        if (pass == opts.robust_iterations - 1) break;

        std::vector<double> abs_res(n);
        for (size_t i = 0; i < n; ++i) abs_res[i] = std::abs(residuals[i]);
        const double mad = median_of(abs_res);
        if (mad < EPS) {
            std::fill(robustness.begin(), robustness.end(), 1.0);
            continue;
        }
        const double cutoff = 6.0 * mad;
        for (size_t i = 0; i < n; ++i) {
            double r = abs_res[i] / cutoff;
            if (r >= 1.0) {
                robustness[i] = 0.0;
            } else {
                double b = 1.0 - r * r;
                robustness[i] = b * b;
            }
        }
    }

    LoessResult result;
    result.points.resize(n);
    for (size_t i = 0; i < n; ++i) {
        result.points[i] = Point{s.x[i], fitted[i]};
    }
    result.diagnostics.residuals = std::move(residuals);
    result.diagnostics.robustness_weights = std::move(robustness);
    result.diagnostics.window_size = k;
    result.diagnostics.passes = opts.robust_iterations;
    return result;
}

}  // namespace growthfit
