#pragma once
// JSON / TSV export of workspace results.
//
// Numbers are written with max_digits10 significant digits so every finite
// double parses back to the identical value; non-finite values become null
// (JSON) or NA (TSV).

#include "growthfit/bootstrap_band.hpp"
#include "growthfit/payload.hpp"
#include "growthfit/types.hpp"

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

namespace growthfit {

std::string format_number(double value);
std::string json_escape(const std::string& text);

// UTC, millisecond precision: 2026-01-31T08:15:00.250Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

void write_payload_json(std::ostream& out, const SmoothedCurvesPayload& payload);

// sample  x  low  high  source
void write_bands_tsv(std::ostream& out, const std::vector<BandResult>& bands);

// sample  start  end  duration_min  manual  n_points  mu_per_min  doubling_min  created_at
// mu is the OLS slope of ln(od600) over the attached points (NA if it cannot
// be fitted).
void write_log_phases_tsv(std::ostream& out, const std::vector<LogPhaseSelection>& phases);

}  // namespace growthfit
