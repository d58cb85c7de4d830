#pragma once

#include <string>

namespace rainsight {
namespace forecast {

/**
 * Forecast horizon granularity
 */
enum class Mode {
    Daily,      // one row per day, 7-day bucket
    Monthly,    // one row per month, 3-month bucket
    Unrelated   // query is not about rainfall
};

std::string modeToString(Mode mode);

/**
 * Parse "daily" / "monthly" / "unrelated" (case-insensitive)
 * Throws ValidationError on anything else
 */
Mode modeFromString(const std::string& text);

/**
 * Number of rows in a feature window (15 daily, 7 monthly)
 */
size_t windowLength(Mode mode);

/**
 * Trailing window of the rolling statistics (7 daily, 3 monthly)
 */
size_t rollingWindow(Mode mode);

/**
 * Number of entries in a published bucket (7 daily, 3 monthly)
 */
size_t bucketSize(Mode mode);

/**
 * Classified request
 */
struct Intent {
    Mode mode = Mode::Unrelated;
    int horizon = 0;            // days or months
    double latitude = 0.0;
    double longitude = 0.0;
    double confidence = 0.0;    // [0, 1]
    std::string explanation;
};

} // namespace forecast
} // namespace rainsight
