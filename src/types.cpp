#include "growthfit/types.hpp"

#include <algorithm>
#include <sstream>

namespace growthfit {

void validate(const SmoothingParameters& params) {
    auto fail = [](const std::string& what) {
        throw InvalidParameter("Invalid smoothing parameter: " + what);
    };

    if (!std::isfinite(params.span) || params.span <= 0.0) {
        std::ostringstream oss;
        oss << "span must be > 0 (got " << params.span << ")";
        fail(oss.str());
    }
    if (params.degree != 1 && params.degree != 2) {
        fail("degree must be 1 or 2 (got " + std::to_string(params.degree) + ")");
    }
    if (params.robust_iterations < 1) {
        fail("robust iterations must be >= 1 (got " +
             std::to_string(params.robust_iterations) + ")");
    }
    if (params.max_refinements < 1) {
        fail("max refinements must be >= 1 (got " +
             std::to_string(params.max_refinements) + ")");
    }
    if (!std::isfinite(params.convergence_tolerance) || params.convergence_tolerance <= 0.0) {
        std::ostringstream oss;
        oss << "convergence tolerance must be > 0 (got " << params.convergence_tolerance << ")";
        fail(oss.str());
    }
}

std::vector<Point> finite_sorted(const std::vector<Point>& points) {
    std::vector<Point> out;
    out.reserve(points.size());
    for (const auto& p : points) {
        if (is_finite(p)) out.push_back(p);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const Point& a, const Point& b) { return a.x < b.x; });
    return out;
}

}  // namespace growthfit
