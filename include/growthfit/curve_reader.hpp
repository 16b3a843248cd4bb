#pragma once
// Long-format curve table reader (plain or gzip, via zlib).
//
// Tab-separated, header required. Columns (any order):
//   sample  well  replicate  time_min  value  [color]
// Rows whose time or value is missing or non-finite are dropped and counted.
// Structural problems (missing columns, bad replicate index, empty sample or
// well) throw std::runtime_error with file and line.

#include "growthfit/curve_workspace.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace growthfit {

struct CurveTable {
    std::vector<SampleInput> samples;  // first-appearance order
    size_t rows = 0;                   // data rows kept
    size_t dropped = 0;                // rows with non-finite numbers
};

CurveTable read_curve_table(const std::string& path);

// Adds every sample of the table to the workspace, in table order.
void load_into(CurveWorkspace& workspace, CurveTable table);

}  // namespace growthfit
