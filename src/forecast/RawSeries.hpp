#pragma once

#include "core/Calendar.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace rainsight {
namespace forecast {

/**
 * Chronological table of raw environmental observations
 *
 * One row per day (or per month), columns indexed by field name.
 * Values that were not reported for a row are stored as NaN.
 * Rows must be appended with strictly increasing dates.
 */
class RawSeries {
public:
    /// Sentinel used by the provider for "no measurement"
    static constexpr double kMissingSentinel = -999.0;

    RawSeries() = default;

    /**
     * Append a row. Throws ValidationError if date is not after the last row.
     */
    void addRow(const CivilDate& date, const std::unordered_map<std::string, double>& values);

    size_t rowCount() const { return m_dates.size(); }
    bool empty() const { return m_dates.empty(); }

    const std::vector<CivilDate>& dates() const { return m_dates; }

    bool hasField(const std::string& name) const;

    /**
     * Column values (NaN where unreported). Empty if the field was never seen.
     */
    const std::vector<double>& column(const std::string& name) const;

    /**
     * Value at (row, field), NaN if unreported
     */
    double value(size_t row, const std::string& name) const;

    std::vector<std::string> fieldNames() const;

private:
    std::vector<CivilDate> m_dates;
    std::map<std::string, std::vector<double>> m_columns;
};

} // namespace forecast
} // namespace rainsight
