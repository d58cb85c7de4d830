#include "forecast/Forecaster.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace rainsight {
namespace forecast {

// =============================================================================
// ForecastSequence
// =============================================================================

size_t ForecastSequence::degradedSteps() const {
    return static_cast<size_t>(std::count_if(steps.begin(), steps.end(),
        [](const ForecastStep& s) { return s.degraded; }));
}

std::vector<double> ForecastSequence::values() const {
    std::vector<double> result;
    result.reserve(steps.size());
    for (const auto& step : steps) {
        result.push_back(step.valueMm);
    }
    return result;
}

nlohmann::json ForecastSequence::toJson() const {
    nlohmann::json j;
    j["mode"] = modeToString(mode);
    j["steps"] = nlohmann::json::array();
    for (const auto& step : steps) {
        nlohmann::json s;
        s["index"] = step.horizonIndex;
        s["rainfall_mm"] = step.valueMm;
        if (step.degraded) {
            s["degraded"] = true;
        }
        j["steps"].push_back(s);
    }
    return j;
}

// =============================================================================
// Forecaster
// =============================================================================

ForecastSequence Forecaster::forecast(const FeatureWindow& window, int horizon,
                                      const ModelArtifacts& artifacts,
                                      const std::string& context) const {
    if (!artifacts.predictor || !artifacts.scaler) {
        throw ArtifactLoadError("Incomplete artifacts for " + modeToString(artifacts.mode));
    }
    return forecast(window, horizon, *artifacts.predictor, *artifacts.scaler, context);
}

ForecastSequence Forecaster::forecast(const FeatureWindow& window, int horizon,
                                      const IPredictor& predictor, const IScaler& scaler,
                                      const std::string& context) const {
    if (horizon < 1) {
        throw ValidationError("Forecast horizon must be at least 1, got " + std::to_string(horizon));
    }
    if (window.length() != windowLength(window.mode)) {
        throw ValidationError("Feature window has " + std::to_string(window.length()) +
                              " rows, " + std::to_string(windowLength(window.mode)) + " expected");
    }
    if (window.dates.size() != window.rows.size()) {
        throw ValidationError("Feature window has " + std::to_string(window.dates.size()) +
                              " dates for " + std::to_string(window.rows.size()) + " rows");
    }
    if (scaler.width() != window.width()) {
        throw ValidationError("Scaler width " + std::to_string(scaler.width()) +
                              " does not match window width " + std::to_string(window.width()));
    }

    const std::string prefix = context.empty() ? "" : "[" + context + "] ";
    const size_t target = window.targetIndex();

    ForecastSequence sequence;
    sequence.mode = window.mode;
    sequence.steps.reserve(static_cast<size_t>(horizon));

    FeatureWindow current = window;

    for (int k = 1; k <= horizon; ++k) {
        std::vector<double> scaled = scaler.transform(current.rows.back());

        bool degraded = false;
        double prediction = 0.0;
        try {
            prediction = predictor.predict(scaled);
            if (!std::isfinite(prediction)) {
                LOG_WARN(prefix + "Step " + std::to_string(k) + ": non-finite prediction, using 0");
                degraded = true;
                prediction = 0.0;
            }
        } catch (const std::exception& e) {
            LOG_WARN(prefix + "Step " + std::to_string(k) + ": prediction failed, using 0: " + e.what());
            degraded = true;
            prediction = 0.0;
        }

        // Back to the transformed (log) space
        scaled[target] = prediction;
        double logValue = scaler.inverseTransform(scaled)[target];
        if (!std::isfinite(logValue)) {
            LOG_WARN(prefix + "Step " + std::to_string(k) + ": non-finite inverse value, using 0");
            degraded = true;
            scaled[target] = 0.0;
            logValue = scaler.inverseTransform(scaled)[target];
        }

        ForecastStep step;
        step.horizonIndex = k;
        step.valueMm = std::max(0.0, std::expm1(logValue));
        if (!std::isfinite(step.valueMm)) step.valueMm = 0.0;
        step.degraded = degraded;
        sequence.steps.push_back(step);

        CivilDate next = current.mode == Mode::Monthly
            ? addMonths(current.dates.back(), 1)
            : addDays(current.dates.back(), 1);
        current.push(synthesizeRow(current, logValue), next);
    }

    LOG_DEBUG(prefix + "Forecast " + modeToString(window.mode) + " horizon " + std::to_string(horizon) +
              " (" + std::to_string(sequence.degradedSteps()) + " degraded)");
    return sequence;
}

std::vector<double> Forecaster::synthesizeRow(const FeatureWindow& window, double logValue) const {
    std::vector<double> row = window.rows.back();

    std::vector<double> history = window.targetHistory();
    history.push_back(logValue);

    const auto& lags = FeatureEngineer::lagOffsets();
    for (size_t i = 0; i < lags.size(); ++i) {
        size_t lag = lags[i];
        std::string name = std::string(FeatureEngineer::kTargetFeature) + "_lag" + std::to_string(lag);
        row[window.columnIndex(name)] = lag < history.size() ? history[history.size() - 1 - lag] : 0.0;
    }

    size_t span = std::min(rollingWindow(window.mode), history.size());
    RollingStats stats = rollingStats(history.cend() - static_cast<std::ptrdiff_t>(span), history.cend());
    row[window.columnIndex("rain_rolling_mean")] = stats.mean;
    row[window.columnIndex("rain_rolling_std")] = stats.stddev;

    row[window.targetIndex()] = logValue;
    return row;
}

} // namespace forecast
} // namespace rainsight
