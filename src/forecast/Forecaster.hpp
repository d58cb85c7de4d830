#pragma once

#include "forecast/FeatureEngineer.hpp"
#include "forecast/ModelArtifacts.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rainsight {
namespace forecast {

/**
 * One forecast value
 */
struct ForecastStep {
    int horizonIndex = 0;       // 1-based
    double valueMm = 0.0;       // >= 0
    bool degraded = false;      // prediction failed, value derived from a zero scaled output
};

/**
 * Ordered forecast, exactly `horizon` steps
 */
struct ForecastSequence {
    Mode mode = Mode::Daily;
    std::vector<ForecastStep> steps;

    size_t size() const { return steps.size(); }
    size_t degradedSteps() const;
    std::vector<double> values() const;
    nlohmann::json toJson() const;
};

/**
 * Autoregressive multi-step forecaster
 *
 * Each step predicts the next target from the last window row, then appends a
 * synthesized row (covariates carried forward, lags and rolling statistics
 * recomputed from the extended target history) so the next step sees its own
 * prediction.
 */
class Forecaster {
public:
    /**
     * @param context Free text added to log lines (session id)
     * Throws ValidationError on horizon < 1, wrong window length or
     * scaler/window width mismatch
     */
    ForecastSequence forecast(const FeatureWindow& window, int horizon,
                              const IPredictor& predictor, const IScaler& scaler,
                              const std::string& context = "") const;

    ForecastSequence forecast(const FeatureWindow& window, int horizon,
                              const ModelArtifacts& artifacts,
                              const std::string& context = "") const;

private:
    /**
     * Row that follows `window` once the transformed target equals logValue
     */
    std::vector<double> synthesizeRow(const FeatureWindow& window, double logValue) const;
};

} // namespace forecast
} // namespace rainsight
