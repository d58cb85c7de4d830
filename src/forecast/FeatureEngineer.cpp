#include "forecast/FeatureEngineer.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace rainsight {
namespace forecast {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

/**
 * Column with sentinel replaced, filled forward then backward.
 * A column without any known value is returned as zeros.
 */
std::vector<double> completeColumn(const RawSeries& raw, const std::string& field) {
    std::vector<double> values = raw.column(field);
    if (values.empty()) {
        return std::vector<double>(raw.rowCount(), 0.0);
    }

    for (auto& v : values) {
        if (v == RawSeries::kMissingSentinel) v = kNaN;
    }

    // Forward fill
    double last = kNaN;
    for (auto& v : values) {
        if (std::isnan(v)) v = last;
        else last = v;
    }

    // Backward fill (leading gap)
    last = kNaN;
    for (auto it = values.rbegin(); it != values.rend(); ++it) {
        if (std::isnan(*it)) *it = last;
        else last = *it;
    }

    if (std::isnan(values.front())) {
        LOG_DEBUG("Field " + field + " has no known value, using zeros");
        std::fill(values.begin(), values.end(), 0.0);
    }
    return values;
}

double safeLog1p(double value) {
    double result = std::log1p(value);
    return std::isfinite(result) ? result : kNaN;
}

} // anonymous namespace

// =============================================================================
// FeatureWindow
// =============================================================================

size_t FeatureWindow::columnIndex(const std::string& name) const {
    auto it = std::find(featureNames.begin(), featureNames.end(), name);
    if (it == featureNames.end()) {
        throw ValidationError("Unknown feature column: " + name);
    }
    return static_cast<size_t>(it - featureNames.begin());
}

std::vector<double> FeatureWindow::targetHistory() const {
    std::vector<double> history;
    history.reserve(rows.size());
    size_t target = targetIndex();
    for (const auto& row : rows) {
        history.push_back(row[target]);
    }
    return history;
}

void FeatureWindow::push(std::vector<double> row, const CivilDate& date) {
    if (row.size() != width()) {
        throw ValidationError("Row width " + std::to_string(row.size()) +
                              " does not match window width " + std::to_string(width()));
    }
    rows.push_back(std::move(row));
    dates.push_back(date);
    if (rows.size() > 1) {
        rows.erase(rows.begin());
        dates.erase(dates.begin());
    }
}

// =============================================================================
// Rolling statistics
// =============================================================================

RollingStats rollingStats(std::vector<double>::const_iterator first,
                          std::vector<double>::const_iterator last) {
    RollingStats stats;
    auto count = std::distance(first, last);
    if (count <= 0) {
        stats.mean = kNaN;
        stats.stddev = kNaN;
        return stats;
    }

    double sum = 0.0;
    for (auto it = first; it != last; ++it) sum += *it;
    stats.mean = sum / static_cast<double>(count);

    if (count < 2) {
        stats.stddev = kNaN;
        return stats;
    }
    double sq = 0.0;
    for (auto it = first; it != last; ++it) {
        double d = *it - stats.mean;
        sq += d * d;
    }
    stats.stddev = std::sqrt(sq / static_cast<double>(count - 1));
    return stats;
}

// =============================================================================
// FeatureEngineer
// =============================================================================

const std::vector<std::string>& FeatureEngineer::requiredFields() {
    static const std::vector<std::string> fields = {
        "RH2M", "WS10M", "T2M", "WD10M", "ALLSKY_SFC_SW_DWN", "EVPTRNS",
        "PS", "QV2M", "T2M_RANGE", "TS", "CLRSKY_SFC_SW_DWN"
    };
    return fields;
}

const std::vector<std::string>& FeatureEngineer::featureNames() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> result;
        for (const auto& field : requiredFields()) {
            result.push_back("log_" + field);
        }
        result.push_back("log_PRECTOTCORR_lag1");
        result.push_back("log_PRECTOTCORR_lag3");
        result.push_back("log_PRECTOTCORR_lag7");
        result.push_back("rain_rolling_mean");
        result.push_back("rain_rolling_std");
        result.push_back(kTargetFeature);
        return result;
    }();
    return names;
}

const std::vector<size_t>& FeatureEngineer::lagOffsets() {
    static const std::vector<size_t> offsets = {1, 3, 7};
    return offsets;
}

FeatureWindow FeatureEngineer::build(const RawSeries& raw, Mode mode) const {
    const size_t length = windowLength(mode);
    const size_t rolling = rollingWindow(mode);
    const size_t rowCount = raw.rowCount();

    // Transformed covariates, model order
    std::vector<std::vector<double>> columns;
    columns.reserve(featureNames().size());

    auto transform = [&](const std::string& field) {
        std::vector<double> values = completeColumn(raw, field);
        if (mode == Mode::Daily) {
            for (auto& v : values) v = std::max(v, 0.0);
        }
        for (auto& v : values) v = safeLog1p(v);
        return values;
    };

    for (const auto& field : requiredFields()) {
        columns.push_back(transform(field));
    }
    std::vector<double> target = transform(kTargetField);

    // Lags
    for (size_t offset : lagOffsets()) {
        std::vector<double> lag(rowCount, kNaN);
        for (size_t i = offset; i < rowCount; ++i) {
            lag[i] = target[i - offset];
        }
        columns.push_back(std::move(lag));
    }

    // Causal rolling statistics, current row included
    std::vector<double> rollingMean(rowCount, kNaN);
    std::vector<double> rollingStd(rowCount, kNaN);
    for (size_t i = rolling - 1; i < rowCount; ++i) {
        auto first = target.cbegin() + static_cast<std::ptrdiff_t>(i + 1 - rolling);
        auto last = target.cbegin() + static_cast<std::ptrdiff_t>(i + 1);
        if (std::any_of(first, last, [](double v) { return std::isnan(v); })) continue;
        RollingStats stats = rollingStats(first, last);
        rollingMean[i] = stats.mean;
        rollingStd[i] = stats.stddev;
    }
    columns.push_back(std::move(rollingMean));
    columns.push_back(std::move(rollingStd));
    columns.push_back(std::move(target));

    // Keep complete rows
    FeatureWindow window;
    window.mode = mode;
    window.featureNames = featureNames();

    for (size_t i = 0; i < rowCount; ++i) {
        std::vector<double> row;
        row.reserve(columns.size());
        bool complete = true;
        for (const auto& column : columns) {
            if (!std::isfinite(column[i])) {
                complete = false;
                break;
            }
            row.push_back(column[i]);
        }
        if (!complete) continue;
        window.rows.push_back(std::move(row));
        window.dates.push_back(raw.dates()[i]);
    }

    if (window.rows.size() < length) {
        throw InsufficientDataError("Only " + std::to_string(window.rows.size()) +
                                    " usable " + modeToString(mode) + " rows, " +
                                    std::to_string(length) + " required");
    }

    size_t drop = window.rows.size() - length;
    window.rows.erase(window.rows.begin(), window.rows.begin() + static_cast<std::ptrdiff_t>(drop));
    window.dates.erase(window.dates.begin(), window.dates.begin() + static_cast<std::ptrdiff_t>(drop));

    LOG_DEBUG("Built " + modeToString(mode) + " feature window: " +
              std::to_string(window.length()) + " rows from " + std::to_string(rowCount));
    return window;
}

} // namespace forecast
} // namespace rainsight
