#include "growthfit/payload_writer.hpp"
#include "growthfit/log_phase.hpp"
#include "growthfit/version.h"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace growthfit {

std::string format_number(double value) {
    if (!std::isfinite(value)) return "null";
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

std::string json_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (unsigned char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    return out;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms_total / 1000);
    int ms = static_cast<int>(ms_total % 1000);
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buf;
}

namespace {

std::string quoted(const std::string& s) {
    return "\"" + json_escape(s) + "\"";
}

void write_points(std::ostream& out, const std::vector<Point>& points) {
    out << "[";
    for (size_t i = 0; i < points.size(); ++i) {
        if (i > 0) out << ", ";
        out << "{\"x\": " << format_number(points[i].x)
            << ", \"y\": " << format_number(points[i].y) << "}";
    }
    out << "]";
}

void write_log_phase(std::ostream& out, const LogPhaseSelection& sel) {
    out << "    {\"sample\": " << quoted(sel.sample)
        << ", \"start\": " << format_number(sel.start)
        << ", \"end\": " << format_number(sel.end)
        << ", \"createdAt\": " << quoted(format_timestamp(sel.created_at))
        << ", \"manual\": " << (sel.manual ? "true" : "false");
    if (!sel.points.empty()) {
        out << ", \"points\": [";
        for (size_t i = 0; i < sel.points.size(); ++i) {
            if (i > 0) out << ", ";
            out << "{\"t_min\": " << format_number(sel.points[i].t_min)
                << ", \"od600\": " << format_number(sel.points[i].od600) << "}";
        }
        out << "]";
    }
    out << "}";
}

void write_band(std::ostream& out, const BandResult& band) {
    out << "    {\"sample\": " << quoted(band.band.sample)
        << ", \"source\": \"" << band_source_to_string(band.source) << "\""
        << ", \"exact\": " << (band.exact ? "true" : "false")
        << ", \"compositions\": " << band.compositions
        << ", \"points\": [";
    for (size_t i = 0; i < band.band.points.size(); ++i) {
        const BandPoint& p = band.band.points[i];
        if (i > 0) out << ", ";
        out << "{\"x\": " << format_number(p.x)
            << ", \"low\": " << format_number(p.low)
            << ", \"high\": " << format_number(p.high) << "}";
    }
    out << "]}";
}

std::string tsv_number(double v) {
    return std::isfinite(v) ? format_number(v) : "NA";
}

}  // namespace

void write_payload_json(std::ostream& out, const SmoothedCurvesPayload& payload) {
    out << "{\n";
    out << "  \"version\": \"" << GROWTHFIT_VERSION << "\",\n";
    out << "  \"generator\": \"growthfit\",\n";
    out << "  \"smoothing\": {\"span\": " << format_number(payload.span)
        << ", \"degree\": " << payload.degree << "},\n";

    out << "  \"samples\": [\n";
    for (size_t s = 0; s < payload.samples.size(); ++s) {
        const PayloadSample& sample = payload.samples[s];
        out << "    {\n";
        out << "      \"sample\": " << quoted(sample.sample) << ",\n";
        out << "      \"color\": " << quoted(sample.color) << ",\n";
        out << "      \"wells\": [";
        for (size_t w = 0; w < sample.wells.size(); ++w) {
            if (w > 0) out << ", ";
            out << "{\"well\": " << quoted(sample.wells[w].well)
                << ", \"replicate\": " << sample.wells[w].replicate << "}";
        }
        out << "],\n";
        out << "      \"history\": [\n";
        for (size_t h = 0; h < sample.history.size(); ++h) {
            out << "        {\"label\": " << quoted(sample.history[h].label) << ", \"points\": ";
            write_points(out, sample.history[h].points);
            out << "}" << (h + 1 < sample.history.size() ? "," : "") << "\n";
        }
        out << "      ]\n";
        out << "    }" << (s + 1 < payload.samples.size() ? "," : "") << "\n";
    }
    out << "  ],\n";

    out << "  \"logPhases\": [\n";
    for (size_t i = 0; i < payload.log_phases.size(); ++i) {
        write_log_phase(out, payload.log_phases[i]);
        out << (i + 1 < payload.log_phases.size() ? "," : "") << "\n";
    }
    out << "  ]";

    if (!payload.bands.empty()) {
        out << ",\n  \"bands\": [\n";
        for (size_t i = 0; i < payload.bands.size(); ++i) {
            write_band(out, payload.bands[i]);
            out << (i + 1 < payload.bands.size() ? "," : "") << "\n";
        }
        out << "  ]";
    }
    out << "\n}\n";
}

void write_bands_tsv(std::ostream& out, const std::vector<BandResult>& bands) {
    out << "sample\tx\tlow\thigh\tsource\n";
    for (const auto& band : bands) {
        const char* source = band_source_to_string(band.source);
        for (const auto& p : band.band.points) {
            out << band.band.sample << '\t' << tsv_number(p.x) << '\t'
                << tsv_number(p.low) << '\t' << tsv_number(p.high) << '\t'
                << source << '\n';
        }
    }
}

void write_log_phases_tsv(std::ostream& out, const std::vector<LogPhaseSelection>& phases) {
    out << "sample\tstart\tend\tduration_min\tmanual\tn_points\tmu_per_min\tdoubling_min\tcreated_at\n";
    for (const auto& sel : phases) {
        std::vector<double> ts, lys;
        for (const auto& p : sel.points) {
            if (p.od600 > 0.0 && std::isfinite(p.od600) && std::isfinite(p.t_min)) {
                ts.push_back(p.t_min);
                lys.push_back(std::log(p.od600));
            }
        }
        double mu = std::nan("");
        LineFit fit;
        if (fit_line(ts, lys, fit)) mu = fit.slope;
        const double doubling = (std::isfinite(mu) && mu > 0.0) ? std::log(2.0) / mu : std::nan("");

        out << sel.sample << '\t' << tsv_number(sel.start) << '\t' << tsv_number(sel.end) << '\t'
            << tsv_number(sel.end - sel.start) << '\t' << (sel.manual ? "yes" : "no") << '\t'
            << sel.points.size() << '\t' << tsv_number(mu) << '\t' << tsv_number(doubling) << '\t'
            << format_timestamp(sel.created_at) << '\n';
    }
}

}  // namespace growthfit
