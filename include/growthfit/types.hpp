#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace growthfit {

// Time in minutes, measurement (OD600 after blank correction).
struct Point {
    double x = 0.0;
    double y = 0.0;
};

inline bool is_finite(const Point& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

// Rejected before any algorithm runs.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& msg)
        : std::invalid_argument(msg) {}
};

// Too few points for the requested fit. Callers skip and count.
class InsufficientData : public std::runtime_error {
public:
    InsufficientData(const std::string& msg, size_t available, size_t required)
        : std::runtime_error(msg), available_(available), required_(required) {}

    size_t available() const { return available_; }
    size_t required() const { return required_; }

private:
    size_t available_;
    size_t required_;
};

struct SmoothingParameters {
    double span = 60.0;                  // <=1: fraction of points, >1: absolute window
    int degree = 1;                      // local polynomial degree, 1 or 2
    int robust_iterations = 3;           // total passes incl. the initial unweighted one
    int max_refinements = 3;             // convergence driver re-runs
    double convergence_tolerance = 1e-4; // max |dy| between successive runs
};

// Throws InvalidParameter on the first violated constraint.
void validate(const SmoothingParameters& params);

struct LoessDiagnostics {
    std::vector<double> residuals;          // y - fit, in output order
    std::vector<double> robustness_weights; // bisquare weights of the last pass
    size_t window_size = 0;                 // k
    int passes = 0;
};

struct SmoothingState {
    std::string label;
    std::vector<Point> points;
    LoessDiagnostics diagnostics;  // empty for the raw state
};

struct ReplicateWell {
    std::string well_id;
    int replicate_index = 1;
    std::vector<Point> points;
};

struct LogPhasePoint {
    double t_min = 0.0;
    double od600 = 0.0;
};

struct LogPhaseSelection {
    std::string sample;
    double start = 0.0;
    double end = 0.0;
    std::chrono::system_clock::time_point created_at;
    bool manual = false;
    std::vector<LogPhasePoint> points;  // empty = not attached
};

struct BandPoint {
    double x = 0.0;
    double low = 0.0;
    double high = 0.0;
};

struct UncertaintyBand {
    std::string sample;
    std::vector<BandPoint> points;
};

// Drop non-finite points, then stable-sort ascending by x.
std::vector<Point> finite_sorted(const std::vector<Point>& points);

}  // namespace growthfit
