#include "growthfit/refinement.hpp"

#include <algorithm>
#include <cmath>

namespace growthfit {

RefinementResult refine(const std::vector<Point>& points,
                        const SmoothingParameters& params,
                        const RefinementProgressCallback& progress) {
    validate(params);

    LoessOptions opts;
    opts.span = params.span;
    opts.degree = params.degree;
    opts.robust_iterations = params.robust_iterations;

    RefinementResult out;
    std::vector<double> previous;
    bool have_previous = false;

    // Every loop smooths the original points. The smoother is deterministic,
    // so the second loop reproduces the first and converges.
    for (int loop = 0; loop < params.max_refinements; ++loop) {
        LoessResult run = loess_smooth(points, opts);
        out.loops = loop + 1;

        double max_diff = std::numeric_limits<double>::infinity();
        if (have_previous && previous.size() == run.points.size()) {
            max_diff = 0.0;
            for (size_t i = 0; i < run.points.size(); ++i) {
                max_diff = std::max(max_diff, std::abs(run.points[i].y - previous[i]));
            }
        }
        out.last_max_diff = max_diff;
        if (progress) progress(out.loops, max_diff);

        previous.resize(run.points.size());
        for (size_t i = 0; i < run.points.size(); ++i) previous[i] = run.points[i].y;
        have_previous = true;
        out.result = std::move(run);

        if (max_diff <= params.convergence_tolerance) {
            out.converged = true;
            break;
        }
    }

    return out;
}

}  // namespace growthfit
