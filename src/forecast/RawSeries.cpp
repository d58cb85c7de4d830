#include "forecast/RawSeries.hpp"
#include "core/Errors.hpp"
#include <limits>

namespace rainsight {
namespace forecast {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const std::vector<double>& emptyColumn() {
    static const std::vector<double> empty;
    return empty;
}

} // anonymous namespace

void RawSeries::addRow(const CivilDate& date, const std::unordered_map<std::string, double>& values) {
    if (!m_dates.empty() && !(m_dates.back() < date)) {
        throw ValidationError("Rows must have strictly increasing dates: " + toIsoString(date) +
                              " after " + toIsoString(m_dates.back()));
    }

    size_t previousRows = m_dates.size();
    m_dates.push_back(date);

    // New columns are back-filled with NaN for earlier rows
    for (const auto& [name, value] : values) {
        auto it = m_columns.find(name);
        if (it == m_columns.end()) {
            it = m_columns.emplace(name, std::vector<double>(previousRows, kNaN)).first;
        }
        it->second.push_back(value);
    }

    // Columns not reported in this row
    for (auto& [name, column] : m_columns) {
        if (column.size() < m_dates.size()) {
            column.push_back(kNaN);
        }
    }
}

bool RawSeries::hasField(const std::string& name) const {
    return m_columns.count(name) > 0;
}

const std::vector<double>& RawSeries::column(const std::string& name) const {
    auto it = m_columns.find(name);
    if (it == m_columns.end()) {
        return emptyColumn();
    }
    return it->second;
}

double RawSeries::value(size_t row, const std::string& name) const {
    const auto& col = column(name);
    if (row >= col.size()) {
        return kNaN;
    }
    return col[row];
}

std::vector<std::string> RawSeries::fieldNames() const {
    std::vector<std::string> names;
    names.reserve(m_columns.size());
    for (const auto& [name, column] : m_columns) {
        names.push_back(name);
    }
    return names;
}

} // namespace forecast
} // namespace rainsight
