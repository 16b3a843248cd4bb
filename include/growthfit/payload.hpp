#pragma once
// Export shapes handed to the JSON/TSV writers. Values only, no references
// back into the workspace.

#include "growthfit/bootstrap_band.hpp"
#include "growthfit/types.hpp"

#include <string>
#include <vector>

namespace growthfit {

struct PayloadWell {
    std::string well;
    int replicate = 1;
};

struct PayloadHistoryEntry {
    std::string label;
    std::vector<Point> points;
};

struct PayloadSample {
    std::string sample;
    std::string color;
    std::vector<PayloadWell> wells;
    std::vector<PayloadHistoryEntry> history;  // [0] is always the raw curve
};

struct SmoothedCurvesPayload {
    double span = 0.0;
    int degree = 1;
    std::vector<PayloadSample> samples;
    std::vector<LogPhaseSelection> log_phases;
    std::vector<BandResult> bands;  // optional, on request
};

}  // namespace growthfit
