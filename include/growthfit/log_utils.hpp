#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace growthfit {
namespace log_utils {

// "850 ms", "1.2 s", "3m 4s", "1h 2m 3s".
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) return std::to_string(ms) + " ms";

    std::ostringstream oss;
    const int64_t secs = ms / 1000;
    if (secs < 60) {
        oss << std::fixed << std::setprecision(1) << static_cast<double>(ms) / 1000.0 << " s";
    } else if (secs < 3600) {
        oss << secs / 60 << "m " << secs % 60 << "s";
    } else {
        oss << secs / 3600 << "h " << (secs / 60) % 60 << "m " << secs % 60 << "s";
    }
    return oss.str();
}

inline std::string format_elapsed(std::chrono::steady_clock::time_point start,
                                  std::chrono::steady_clock::time_point end) {
    return format_duration_ms(
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());
}

// "  [3/12] S4" style progress line for batch loops.
inline std::string format_progress(size_t done, size_t total, const std::string& what) {
    std::ostringstream oss;
    oss << "  [" << done << "/" << total << "] " << what;
    return oss.str();
}

}  // namespace log_utils
}  // namespace growthfit
