#pragma once

#include "core/Calendar.hpp"
#include "forecast/Forecaster.hpp"
#include "forecast/Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rainsight {
namespace forecast {

/**
 * Which Sunday starts the published week
 */
enum class WeekAnchor {
    Current,    // Sunday of the week containing today
    Next        // following Sunday (a week later when today is Sunday)
};

std::string weekAnchorToString(WeekAnchor anchor);
WeekAnchor weekAnchorFromString(const std::string& text);

struct BucketEntry {
    CivilDate date;
    double rainfallMm = 0.0;
};

/**
 * Calendar-aligned forecast: 7 days (Sun..Sat) or 3 months
 */
struct BucketedForecast {
    Mode mode = Mode::Daily;
    std::vector<BucketEntry> entries;

    size_t size() const { return entries.size(); }

    /**
     * [{"date": "YYYY-MM-DD", "rainfall": 1.23}, ...], values rounded to 2 decimals
     */
    nlohmann::json toJson() const;

    static BucketedForecast fromJson(Mode mode, const nlohmann::json& payload);
};

/**
 * Maps forecast steps onto calendar dates
 */
class ResultBucketer {
public:
    explicit ResultBucketer(WeekAnchor anchor = WeekAnchor::Current)
        : m_anchor(anchor) {}

    /**
     * Extra steps are dropped, missing ones padded with 0.0
     * Throws ValidationError for Mode::Unrelated
     */
    BucketedForecast bucket(const ForecastSequence& sequence, Mode mode, const CivilDate& today) const;

    /**
     * Sunday starting the week to publish
     */
    CivilDate weekStart(const CivilDate& today) const;

    WeekAnchor anchor() const { return m_anchor; }

private:
    WeekAnchor m_anchor;
};

} // namespace forecast
} // namespace rainsight
