#include "growthfit/log_phase.hpp"

#include <algorithm>
#include <cmath>

namespace growthfit {

namespace {

constexpr size_t K_TAIL_POINTS = 5;

double median_of(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) return 0.5 * (values[mid - 1] + values[mid]);
    return values[mid];
}

struct Run {
    size_t first = 0;  // sorted positions, inclusive
    size_t last = 0;
};

}  // namespace

LogPhaseDetectionOptions clamp_detection_options(const LogPhaseDetectionOptions& options) {
    const LogPhaseDetectionOptions defaults;
    LogPhaseDetectionOptions out = options;

    out.window_size = std::max(2, options.window_size);

    double r2 = std::isfinite(options.r2_min) ? options.r2_min : defaults.r2_min;
    out.r2_min = std::min(0.9999, std::max(0.1, r2));

    double od = std::isfinite(options.od_min) ? options.od_min : defaults.od_min;
    out.od_min = std::max(0.0, od);

    double frac = std::isfinite(options.frac_k_max) ? options.frac_k_max : defaults.frac_k_max;
    out.frac_k_max = std::min(0.95, std::max(0.05, frac));

    double lo = std::isfinite(options.mu_rel_min) ? options.mu_rel_min : defaults.mu_rel_min;
    out.mu_rel_min = std::max(0.1, lo);

    double hi = std::isfinite(options.mu_rel_max) ? options.mu_rel_max : defaults.mu_rel_max;
    out.mu_rel_max = std::max(out.mu_rel_min + 1e-3, hi);

    return out;
}

bool fit_line(const std::vector<double>& xs, const std::vector<double>& ys, LineFit& fit) {
    const size_t n = xs.size();
    if (n < 2 || ys.size() != n) return false;

    double mean_x = 0.0, mean_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mean_x += xs[i];
        mean_y += ys[i];
    }
    mean_x /= static_cast<double>(n);
    mean_y /= static_cast<double>(n);

    double s_xx = 0.0, s_xy = 0.0, s_yy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = xs[i] - mean_x;
        const double dy = ys[i] - mean_y;
        s_xx += dx * dx;
        s_xy += dx * dy;
        s_yy += dy * dy;
    }
    if (s_xx == 0.0) return false;

    fit.slope = s_xy / s_xx;
    fit.intercept = mean_y - fit.slope * mean_x;

    double ss_res = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double r = ys[i] - (fit.slope * xs[i] + fit.intercept);
        ss_res += r * r;
    }
    fit.r2 = s_yy == 0.0 ? 1.0 : 1.0 - ss_res / s_yy;
    return true;
}

LogPhaseDetection detect_log_phase(const std::vector<Point>& points,
                                   const LogPhaseDetectionOptions& options) {
    const LogPhaseDetectionOptions opts = clamp_detection_options(options);
    const size_t window = static_cast<size_t>(opts.window_size);
    LogPhaseDetection out;

    // Time order with links back to the caller's positions.
    std::vector<size_t> order;
    order.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        if (is_finite(points[i])) order.push_back(i);
    }
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return points[a].x < points[b].x;
    });
    const size_t n = order.size();
    std::vector<double> xs(n), ys(n);
    for (size_t p = 0; p < n; ++p) {
        xs[p] = points[order[p]].x;
        ys[p] = points[order[p]].y;
    }

    std::vector<size_t> valid;
    for (size_t p = 0; p < n; ++p) {
        if (ys[p] >= opts.od_min && ys[p] > 0.0) valid.push_back(p);
    }
    if (valid.size() < window) return out;

    std::vector<double> tail;
    for (size_t i = valid.size() - std::min(K_TAIL_POINTS, valid.size()); i < valid.size(); ++i) {
        tail.push_back(ys[valid[i]]);
    }
    const double k_estimate = median_of(tail);
    if (!(k_estimate > 0.0)) return out;
    out.k_estimate = k_estimate;

    struct Candidate {
        size_t first;
        size_t last;
        GrowthWindow stats;
    };
    std::vector<Candidate> good;
    std::vector<double> wx(window), wy(window);

    for (size_t k = 0; k + window <= valid.size(); ++k) {
        out.windows_evaluated++;
        double max_y = 0.0;
        for (size_t j = 0; j < window; ++j) {
            const size_t p = valid[k + j];
            wx[j] = xs[p];
            wy[j] = std::log(ys[p]);
            max_y = std::max(max_y, ys[p]);
        }
        // Plateau guard: the window must stay clear of the carrying capacity.
        if (max_y / k_estimate >= opts.frac_k_max) continue;

        LineFit fit;
        if (!fit_line(wx, wy, fit)) continue;
        if (fit.slope <= 0.0) continue;
        if (fit.r2 < opts.r2_min) continue;

        Candidate c;
        c.first = valid[k];
        c.last = valid[k + window - 1];
        c.stats.start_time = xs[c.first];
        c.stats.end_time = xs[c.last];
        c.stats.slope = fit.slope;
        c.stats.r2 = fit.r2;
        good.push_back(c);
    }
    if (good.empty()) return out;

    double mu_max = good.front().stats.slope;
    for (const auto& c : good) mu_max = std::max(mu_max, c.stats.slope);
    out.mu_max = mu_max;

    std::vector<Candidate> accepted;
    for (auto c : good) {
        c.stats.mu_rel = c.stats.slope / mu_max;
        if (c.stats.mu_rel >= opts.mu_rel_min && c.stats.mu_rel <= opts.mu_rel_max) {
            accepted.push_back(c);
        }
    }
    if (accepted.empty()) {
        // Nothing inside the mu band: keep the steepest window alone.
        auto best = std::max_element(good.begin(), good.end(),
                                     [](const Candidate& a, const Candidate& b) {
                                         return a.stats.slope < b.stats.slope;
                                     });
        Candidate c = *best;
        c.stats.mu_rel = 1.0;
        accepted.push_back(c);
    }

    std::vector<char> is_log(n, 0);
    for (const auto& c : accepted) {
        for (size_t p = c.first; p <= c.last; ++p) is_log[p] = 1;
    }

    std::vector<Run> runs;
    for (size_t p = 0; p < n; ++p) {
        if (!is_log[p]) continue;
        if (!runs.empty() && runs.back().last + 1 == p) {
            runs.back().last = p;
        } else {
            runs.push_back(Run{p, p});
        }
    }
    if (runs.empty()) return out;

    auto extent = [&](const Run& r) { return xs[r.last] - xs[r.first]; };
    Run best = runs.front();
    for (size_t i = 1; i < runs.size(); ++i) {
        const Run& r = runs[i];
        const double er = extent(r), eb = extent(best);
        if (er > eb) {
            best = r;
        } else if (er == eb) {
            if (xs[r.first] < xs[best.first] ||
                (xs[r.first] == xs[best.first] && r.last - r.first > best.last - best.first)) {
                best = r;
            }
        }
    }

    for (size_t p = best.first; p <= best.last; ++p) out.indices.push_back(order[p]);
    out.start_time = xs[best.first];
    out.end_time = xs[best.last];

    double mu_sum = 0.0;
    size_t mu_count = 0;
    for (const auto& c : accepted) {
        if (c.last < best.first || c.first > best.last) continue;
        mu_sum += c.stats.slope;
        mu_count++;
    }
    out.mu_mean = mu_count > 0 ? mu_sum / static_cast<double>(mu_count) : mu_max;

    std::vector<double> run_x, run_y;
    for (size_t p = best.first; p <= best.last; ++p) {
        if (ys[p] >= opts.od_min && ys[p] > 0.0) {
            run_x.push_back(xs[p]);
            run_y.push_back(std::log(ys[p]));
        }
    }
    LineFit run_fit;
    if (fit_line(run_x, run_y, run_fit)) {
        out.fit = run_fit;
        out.mu_rel = run_fit.slope / mu_max;
    }

    out.windows.reserve(accepted.size());
    for (const auto& c : accepted) out.windows.push_back(c.stats);
    return out;
}

}  // namespace growthfit
