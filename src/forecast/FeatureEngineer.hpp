#pragma once

#include "forecast/RawSeries.hpp"
#include "forecast/Types.hpp"
#include <string>
#include <vector>

namespace rainsight {
namespace forecast {

/**
 * Fixed-width, fixed-length model input
 *
 * Rows are in chronological order, the transformed target column is last.
 * push() keeps the length constant (oldest row dropped).
 */
struct FeatureWindow {
    Mode mode = Mode::Daily;
    std::vector<std::string> featureNames;
    std::vector<std::vector<double>> rows;
    std::vector<CivilDate> dates;

    size_t width() const { return featureNames.size(); }
    size_t length() const { return rows.size(); }
    size_t targetIndex() const { return featureNames.empty() ? 0 : featureNames.size() - 1; }

    size_t columnIndex(const std::string& name) const;

    /**
     * Transformed target values, oldest first
     */
    std::vector<double> targetHistory() const;

    /**
     * Append a row and drop the oldest one
     * Throws ValidationError if the row width does not match
     */
    void push(std::vector<double> row, const CivilDate& date);
};

/**
 * Mean and sample standard deviation (ddof = 1)
 */
struct RollingStats {
    double mean = 0.0;
    double stddev = 0.0;
};

RollingStats rollingStats(std::vector<double>::const_iterator first,
                          std::vector<double>::const_iterator last);

/**
 * Turns a raw observation table into the model's feature window
 *
 * Cleaning: sentinel -999 and unreported values are filled forward then
 * backward, absent fields become zeros, daily values are clipped at 0.
 * Features: log1p of every field, target lags 1/3/7, rolling mean/std of the
 * transformed target. Rows with any unavailable value are dropped and the
 * last N rows kept (N = 15 daily, 7 monthly).
 */
class FeatureEngineer {
public:
    static constexpr const char* kTargetField = "PRECTOTCORR";
    static constexpr const char* kTargetFeature = "log_PRECTOTCORR";

    /**
     * Raw covariates in model order (target excluded)
     */
    static const std::vector<std::string>& requiredFields();

    /**
     * The 17 window columns in model order, target last
     */
    static const std::vector<std::string>& featureNames();

    /**
     * Lag offsets of the transformed target
     */
    static const std::vector<size_t>& lagOffsets();

    /**
     * Build the window for the given mode
     * Throws InsufficientDataError if fewer than N usable rows remain
     * Throws ValidationError for Mode::Unrelated
     */
    FeatureWindow build(const RawSeries& raw, Mode mode) const;
};

} // namespace forecast
} // namespace rainsight
