#include "forecast/Types.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace rainsight {
namespace forecast {

std::string modeToString(Mode mode) {
    switch (mode) {
        case Mode::Daily: return "daily";
        case Mode::Monthly: return "monthly";
        case Mode::Unrelated: return "unrelated";
        default: return "unknown";
    }
}

Mode modeFromString(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "daily") return Mode::Daily;
    if (lower == "monthly") return Mode::Monthly;
    if (lower == "unrelated") return Mode::Unrelated;
    throw ValidationError("Unknown forecast mode: " + text);
}

size_t windowLength(Mode mode) {
    switch (mode) {
        case Mode::Daily: return 15;
        case Mode::Monthly: return 7;
        default: throw ValidationError("No feature window for mode: " + modeToString(mode));
    }
}

size_t rollingWindow(Mode mode) {
    switch (mode) {
        case Mode::Daily: return 7;
        case Mode::Monthly: return 3;
        default: throw ValidationError("No rolling window for mode: " + modeToString(mode));
    }
}

size_t bucketSize(Mode mode) {
    switch (mode) {
        case Mode::Daily: return 7;
        case Mode::Monthly: return 3;
        default: throw ValidationError("No bucket for mode: " + modeToString(mode));
    }
}

} // namespace forecast
} // namespace rainsight
