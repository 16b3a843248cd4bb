// tests/test_log_phase.cpp
//
// Log-phase detector:
//   - pure exponential: the whole curve up to the plateau guard
//   - logistic: detection stops before the carrying capacity
//   - flat noise: nothing detected
//   - r2_min 0.99 on an exponential, 0.9 on uniform noise
//   - too few points for one window: nothing detected
//   - two equally long exponential runs: the earlier wins; a longer later
//     run wins over a shorter earlier one
//   - indices refer to the caller's (unsorted) input
//   - option clamping

#include "growthfit/log_phase.hpp"

#include <algorithm>
#include <cstdint>
#include <cmath>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace growthfit;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

std::vector<Point> exponential(double r, int t_end, int step) {
    std::vector<Point> pts;
    for (int t = 0; t <= t_end; t += step) pts.push_back({double(t), 0.01 * std::exp(r * t)});
    return pts;
}

// Two exponential segments split by a point below od_min, then a plateau.
std::vector<Point> two_segments(int second_end) {
    std::vector<Point> pts;
    for (int t = 0; t < 50; t += 5) pts.push_back({double(t), 0.01 * std::exp(0.05 * t)});
    pts.push_back({47.5, 0.0005});
    for (int t = 50; t <= second_end; t += 5) pts.push_back({double(t), 0.01 * std::exp(0.05 * (t - 50))});
    for (int t = second_end + 5; t < second_end + 50; t += 5) pts.push_back({double(t), 1.0});
    return pts;
}

int test_exponential_curve() {
    std::cout << "Testing pure exponential... ";
    int failed = 0;
    auto det = detect_log_phase(exponential(0.02, 300, 5));
    expect(det.detected(), "exponential detected", failed);
    if (det.detected()) {
        expect(*det.start_time == 0.0, "starts at 0", failed);
        // K = y(290); windows reaching y >= 0.9 K (t >= 285) are rejected.
        expect(*det.end_time == 280.0, "ends at 280", failed);
        expect(std::abs(*det.mu_max - 0.02) < 1e-9, "mu_max = 0.02", failed);
        expect(det.fit.has_value() && std::abs(det.fit->slope - 0.02) < 1e-9, "run slope", failed);
        expect(det.fit.has_value() && det.fit->r2 > 0.999999, "run r2", failed);
        expect(det.mu_rel.has_value() && std::abs(*det.mu_rel - 1.0) < 1e-6, "mu_rel = 1", failed);
        expect(det.indices.size() == 57, "57 points", failed);
        expect(det.windows_evaluated == 42, "42 windows", failed);
        expect(det.windows.size() == 38, "38 accepted", failed);
    }
    std::cout << (failed == 0 ? "PASSED\n" : "FAILED\n");
    return failed;
}

int test_documented_thresholds() {
    std::cout << "Testing r2_min 0.99 on exponential and 0.9 on noise... ";
    int failed = 0;
    LogPhaseDetectionOptions strict;
    strict.r2_min = 0.99;
    auto det = detect_log_phase(exponential(0.02, 300, 5), strict);
    expect(det.detected(), "exponential detected at r2_min 0.99", failed);
    if (det.detected()) {
        expect(det.fit && std::abs(det.fit->slope - 0.02) <= 0.02 * 0.01, "slope within 1%", failed);
        expect(det.mu_rel && std::abs(*det.mu_rel - 1.0) < 1e-6, "mu_rel = 1", failed);
        expect(*det.start_time == 0.0 && *det.end_time == 280.0, "spans 0..280", failed);
    }

    LogPhaseDetectionOptions loose;
    loose.r2_min = 0.9;
    for (uint64_t seed = 0; seed < 50; ++seed) {
        std::mt19937_64 rng(seed);
        std::uniform_real_distribution<double> noise(0.2, 0.8);
        std::vector<Point> pts;
        for (int i = 0; i < 61; ++i) pts.push_back({i * 5.0, noise(rng)});
        auto none = detect_log_phase(pts, loose);
        expect(!none.detected() && !none.start_time && !none.end_time,
               "noise seed " + std::to_string(seed) + " not detected", failed);
    }
    std::cout << (failed == 0 ? "PASSED\n" : "FAILED\n");
    return failed;
}

int test_logistic_stops_before_plateau() {
    std::cout << "Testing logistic curve... ";
    int failed = 0;
    std::vector<Point> pts;
    for (int t = 0; t <= 300; t += 5) {
        pts.push_back({double(t), 1.0 / (1.0 + 99.0 * std::exp(-0.05 * t))});
    }
    LogPhaseDetectionOptions opts;
    opts.window_size = 8;
    auto det = detect_log_phase(pts, opts);
    expect(det.detected(), "logistic detected", failed);
    if (det.detected()) {
        expect(*det.start_time == 0.0, "starts at 0", failed);
        expect(*det.end_time <= 110.0, "ends before the plateau", failed);
        expect(*det.mu_max > 0.04 && *det.mu_max <= 0.05, "mu_max near r", failed);
        expect(det.k_estimate && std::abs(*det.k_estimate - 1.0) < 1e-3, "K ~ 1", failed);
        for (size_t idx : det.indices) {
            expect(pts[idx].y < 0.9 * *det.k_estimate, "selected points below 0.9 K", failed);
        }
    }
    std::cout << (failed == 0 ? "PASSED\n" : "FAILED\n");
    return failed;
}

int test_noise_and_short_input() {
    std::cout << "Testing flat noise and short input... ";
    int failed = 0;
    std::mt19937_64 rng(42);
    std::uniform_real_distribution<double> noise(-0.05, 0.05);
    std::vector<Point> flat;
    for (int i = 0; i < 100; ++i) flat.push_back({i * 5.0, 0.5 + noise(rng)});
    auto det = detect_log_phase(flat);
    expect(!det.detected(), "noise not detected", failed);
    expect(!det.start_time && !det.end_time, "null times", failed);
    expect(det.indices.empty(), "no indices", failed);

    auto pts = exponential(0.02, 300, 5);  // 61 points
    LogPhaseDetectionOptions opts;
    opts.window_size = 62;
    auto short_det = detect_log_phase(pts, opts);
    expect(!short_det.detected(), "fewer points than the window", failed);
    expect(short_det.windows_evaluated == 0, "no windows evaluated", failed);

    expect(!detect_log_phase({}).detected(), "empty input", failed);
    std::cout << (failed == 0 ? "PASSED\n" : "FAILED\n");
    return failed;
}

int test_run_tie_break() {
    std::cout << "Testing run selection by time extent... ";
    int failed = 0;
    LogPhaseDetectionOptions opts;
    opts.window_size = 4;

    auto equal = detect_log_phase(two_segments(95), opts);
    expect(equal.detected(), "equal runs detected", failed);
    if (equal.detected()) {
        expect(*equal.start_time == 0.0 && *equal.end_time == 45.0, "earlier run wins a tie", failed);
        expect(equal.indices.size() == 10, "10 points", failed);
    }

    auto longer = detect_log_phase(two_segments(100), opts);
    expect(longer.detected(), "longer run detected", failed);
    if (longer.detected()) {
        expect(*longer.start_time == 50.0 && *longer.end_time == 100.0, "longer run wins", failed);
    }
    std::cout << (failed == 0 ? "PASSED\n" : "FAILED\n");
    return failed;
}

int test_indices_map_to_input() {
    std::cout << "Testing indices refer to input positions... ";
    int failed = 0;
    auto pts = exponential(0.02, 300, 5);
    std::mt19937_64 rng(3);
    std::shuffle(pts.begin(), pts.end(), rng);

    auto det = detect_log_phase(pts);
    expect(det.detected(), "shuffled input detected", failed);
    if (det.detected()) {
        expect(*det.start_time == 0.0 && *det.end_time == 280.0, "same window as sorted", failed);
        std::vector<double> times;
        for (size_t idx : det.indices) {
            expect(idx < pts.size(), "index in range", failed);
            times.push_back(pts[idx].x);
        }
        expect(std::is_sorted(times.begin(), times.end()), "indices in time order", failed);
        expect(times.front() == 0.0 && times.back() == 280.0, "indices span the window", failed);
    }
    std::cout << (failed == 0 ? "PASSED\n" : "FAILED\n");
    return failed;
}

int test_option_clamping() {
    std::cout << "Testing option clamping... ";
    int failed = 0;
    LogPhaseDetectionOptions o;
    o.window_size = 0;
    o.r2_min = 2.0;
    o.od_min = -1.0;
    o.frac_k_max = 0.0;
    o.mu_rel_min = 0.0;
    o.mu_rel_max = 0.05;
    auto c = clamp_detection_options(o);
    expect(c.window_size == 2, "window >= 2", failed);
    expect(c.r2_min == 0.9999, "r2 upper clamp", failed);
    expect(c.od_min == 0.0, "od_min >= 0", failed);
    expect(c.frac_k_max == 0.05, "frac_k lower clamp", failed);
    expect(c.mu_rel_min == 0.1, "mu_rel_min >= 0.1", failed);
    expect(std::abs(c.mu_rel_max - 0.101) < 1e-12, "mu_rel_max >= min + 1e-3", failed);

    o = LogPhaseDetectionOptions{};
    o.r2_min = 0.0;
    o.frac_k_max = 1.5;
    o.mu_rel_max = NAN;
    c = clamp_detection_options(o);
    expect(c.r2_min == 0.1, "r2 lower clamp", failed);
    expect(c.frac_k_max == 0.95, "frac_k upper clamp", failed);
    expect(c.mu_rel_max == 1.05, "non-finite falls back to default", failed);
    std::cout << (failed == 0 ? "PASSED\n" : "FAILED\n");
    return failed;
}

int test_fit_line() {
    std::cout << "Testing line fit... ";
    int failed = 0;
    LineFit f;
    expect(fit_line({0, 1, 2, 3}, {1, 3, 5, 7}, f), "fit succeeds", failed);
    expect(std::abs(f.slope - 2.0) < 1e-12 && std::abs(f.intercept - 1.0) < 1e-12, "exact line", failed);
    expect(std::abs(f.r2 - 1.0) < 1e-12, "r2 = 1", failed);
    expect(!fit_line({1, 1, 1}, {1, 2, 3}, f), "no x spread", failed);
    expect(!fit_line({1}, {1}, f), "single point", failed);
    std::cout << (failed == 0 ? "PASSED\n" : "FAILED\n");
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_exponential_curve();
    total += test_documented_thresholds();
    total += test_logistic_stops_before_plateau();
    total += test_noise_and_short_input();
    total += test_run_tie_break();
    total += test_indices_map_to_input();
    total += test_option_clamping();
    total += test_fit_line();

    if (total == 0) {
        std::cout << "\nAll log-phase tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}
