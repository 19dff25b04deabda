#include "format.hpp"
#include <fmt/format.h>
#include <cmath>

static const char SIZE_UNITS[] = {'B', 'K', 'M', 'G', 'T', 'P'};
static constexpr int LAST_UNIT = 5;

std::string format_size(uint64_t bytes) {
    if (bytes < 1024) {
        return fmt::format("{}B", bytes);
    }

    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < LAST_UNIT) {
        value /= 1024.0;
        unit++;
    }

    if (value < 10.0) {
        double rounded = std::ceil(value * 10.0) / 10.0;
        if (rounded < 10.0) {
            return fmt::format("{:.1f}{}", rounded, SIZE_UNITS[unit]);
        }
        value = rounded;
    }

    double rounded = std::ceil(value);
    if (rounded >= 1024.0 && unit < LAST_UNIT) {
        // 1023.6K rounds up into the next unit
        return fmt::format("1.0{}", SIZE_UNITS[unit + 1]);
    }
    return fmt::format("{:.0f}{}", rounded, SIZE_UNITS[unit]);
}

std::string format_elapsed(std::chrono::milliseconds elapsed) {
    auto ms = elapsed.count();
    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }
    if (ms < 60 * 1000) {
        return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
    }
    auto secs = ms / 1000;
    return fmt::format("{}m{}s", secs / 60, secs % 60);
}
