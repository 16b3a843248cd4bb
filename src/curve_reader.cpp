#include "growthfit/curve_reader.hpp"

#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace growthfit {

namespace {

struct GzCloser {
    void operator()(gzFile_s* f) const {
        if (f) gzclose(f);
    }
};
using GzHandle = std::unique_ptr<gzFile_s, GzCloser>;

std::vector<std::string> split_tsv(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (std::getline(iss, field, '\t')) {
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == '\t') fields.emplace_back();
    return fields;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \r\n");
    return s.substr(b, e - b + 1);
}

// NaN for anything that is not a complete finite number.
double parse_number(const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) return std::nan("");
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || errno == ERANGE) return std::nan("");
    return v;
}

std::string where(const std::string& path, size_t line_no) {
    return path + ":" + std::to_string(line_no);
}

}  // namespace

CurveTable read_curve_table(const std::string& path) {
    GzHandle file(gzopen(path.c_str(), "rb"));
    if (!file) {
        throw std::runtime_error("Cannot open curve table: " + path);
    }

    CurveTable table;
    std::unordered_map<std::string, size_t> sample_idx;
    // sample -> (well id -> well slot)
    std::vector<std::unordered_map<std::string, size_t>> well_idx;

    std::map<std::string, int> col;
    const char* required[] = {"sample", "well", "replicate", "time_min", "value"};
    size_t n_cols = 0;

    char buffer[65536];
    std::string line;
    size_t line_no = 0;
    bool have_header = false;

    while (gzgets(file.get(), buffer, sizeof(buffer)) != nullptr) {
        line.assign(buffer);
        // Long lines arrive in several chunks.
        while (!line.empty() && line.back() != '\n' && !gzeof(file.get())) {
            if (gzgets(file.get(), buffer, sizeof(buffer)) == nullptr) break;
            line.append(buffer);
        }
        line_no++;
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') continue;

        std::vector<std::string> fields = split_tsv(line);

        if (!have_header) {
            for (size_t i = 0; i < fields.size(); ++i) col[trim(fields[i])] = static_cast<int>(i);
            for (const char* name : required) {
                if (col.find(name) == col.end()) {
                    throw std::runtime_error(where(path, line_no) +
                                             ": missing required column '" + name + "'");
                }
            }
            n_cols = fields.size();
            have_header = true;
            continue;
        }

        if (fields.size() < n_cols) {
            throw std::runtime_error(where(path, line_no) + ": expected " +
                                     std::to_string(n_cols) + " fields, got " +
                                     std::to_string(fields.size()));
        }

        const std::string sample = trim(fields[col["sample"]]);
        const std::string well = trim(fields[col["well"]]);
        if (sample.empty() || well.empty()) {
            throw std::runtime_error(where(path, line_no) + ": empty sample or well");
        }

        const double rep = parse_number(fields[col["replicate"]]);
        if (!std::isfinite(rep) || rep < 1.0 || rep != std::floor(rep) ||
            rep > static_cast<double>(std::numeric_limits<int>::max())) {
            throw std::runtime_error(where(path, line_no) + ": replicate must be an integer >= 1");
        }

        const double t = parse_number(fields[col["time_min"]]);
        const double v = parse_number(fields[col["value"]]);
        if (!std::isfinite(t) || !std::isfinite(v)) {
            table.dropped++;
            continue;
        }

        auto sit = sample_idx.find(sample);
        if (sit == sample_idx.end()) {
            sit = sample_idx.emplace(sample, table.samples.size()).first;
            SampleInput input;
            input.name = sample;
            table.samples.push_back(std::move(input));
            well_idx.emplace_back();
        }
        SampleInput& input = table.samples[sit->second];
        auto cit = col.find("color");
        if (input.color.empty() && cit != col.end()) {
            input.color = trim(fields[cit->second]);
        }

        auto& wells = well_idx[sit->second];
        auto wit = wells.find(well);
        if (wit == wells.end()) {
            wit = wells.emplace(well, input.wells.size()).first;
            ReplicateWell rw;
            rw.well_id = well;
            rw.replicate_index = static_cast<int>(rep);
            input.wells.push_back(std::move(rw));
        }
        input.wells[wit->second].points.push_back(Point{t, v});
        table.rows++;
    }

    if (!have_header) {
        throw std::runtime_error("Curve table is empty: " + path);
    }

    for (auto& input : table.samples) {
        std::stable_sort(input.wells.begin(), input.wells.end(),
                         [](const ReplicateWell& a, const ReplicateWell& b) {
                             return a.replicate_index < b.replicate_index;
                         });
    }
    return table;
}

void load_into(CurveWorkspace& workspace, CurveTable table) {
    for (auto& input : table.samples) {
        workspace.add_sample(std::move(input));
    }
}

}  // namespace growthfit
