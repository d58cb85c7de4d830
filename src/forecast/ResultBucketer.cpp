#include "forecast/ResultBucketer.hpp"
#include "core/Errors.hpp"
#include <cmath>

namespace rainsight {
namespace forecast {

std::string weekAnchorToString(WeekAnchor anchor) {
    return anchor == WeekAnchor::Next ? "next" : "current";
}

WeekAnchor weekAnchorFromString(const std::string& text) {
    if (text == "current") return WeekAnchor::Current;
    if (text == "next") return WeekAnchor::Next;
    throw ValidationError("Unknown week anchor: " + text + " (expected current|next)");
}

nlohmann::json BucketedForecast::toJson() const {
    nlohmann::json payload = nlohmann::json::array();
    for (const auto& entry : entries) {
        payload.push_back({
            {"date", toIsoString(entry.date)},
            {"rainfall", std::round(entry.rainfallMm * 100.0) / 100.0}
        });
    }
    return payload;
}

BucketedForecast BucketedForecast::fromJson(Mode mode, const nlohmann::json& payload) {
    BucketedForecast result;
    result.mode = mode;
    if (!payload.is_array()) {
        throw ValidationError("Forecast payload must be an array");
    }
    for (const auto& item : payload) {
        BucketEntry entry;
        entry.date = parseDate(item.at("date").get<std::string>());
        entry.rainfallMm = item.at("rainfall").get<double>();
        result.entries.push_back(entry);
    }
    return result;
}

CivilDate ResultBucketer::weekStart(const CivilDate& today) const {
    CivilDate sunday = addDays(today, -weekday(today));
    if (m_anchor == WeekAnchor::Next) {
        sunday = addDays(sunday, 7);
    }
    return sunday;
}

BucketedForecast ResultBucketer::bucket(const ForecastSequence& sequence, Mode mode,
                                        const CivilDate& today) const {
    if (mode == Mode::Unrelated) {
        throw ValidationError("Cannot bucket an unrelated forecast");
    }

    const size_t size = bucketSize(mode);

    BucketedForecast result;
    result.mode = mode;
    result.entries.reserve(size);

    CivilDate start = mode == Mode::Daily ? weekStart(today) : firstOfMonth(today);

    for (size_t i = 0; i < size; ++i) {
        BucketEntry entry;
        entry.date = mode == Mode::Daily
            ? addDays(start, static_cast<int>(i))
            : addMonths(start, static_cast<int>(i));
        entry.rainfallMm = i < sequence.steps.size() ? sequence.steps[i].valueMm : 0.0;
        result.entries.push_back(entry);
    }
    return result;
}

} // namespace forecast
} // namespace rainsight
