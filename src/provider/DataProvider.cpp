#include "provider/DataProvider.hpp"
#include "core/Errors.hpp"
#include "forecast/FeatureEngineer.hpp"
#include "server/Logger.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <map>
#include <sstream>

namespace rainsight {
namespace provider {

using json = nlohmann::json;
using forecast::Mode;
using forecast::RawSeries;

namespace {

std::string compactDate(const CivilDate& date, Mode mode) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year;
    if (mode == Mode::Daily) {
        oss << std::setw(2) << date.month << std::setw(2) << date.day;
    }
    return oss.str();
}

std::string formatCoordinate(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << value;
    return oss.str();
}

} // anonymous namespace

NasaPowerProvider::NasaPowerProvider(NasaPowerOptions options, std::shared_ptr<net::IHttpTransport> transport)
    : m_options(std::move(options))
    , m_transport(std::move(transport))
{
    while (!m_options.baseUrl.empty() && m_options.baseUrl.back() == '/') {
        m_options.baseUrl.pop_back();
    }
}

std::vector<std::string> NasaPowerProvider::parameters() {
    std::vector<std::string> params = forecast::FeatureEngineer::requiredFields();
    params.push_back(forecast::FeatureEngineer::kTargetField);
    return params;
}

DateRange NasaPowerProvider::lookback(Mode mode, const CivilDate& today) const {
    DateRange range;
    if (mode == Mode::Monthly) {
        range.start = CivilDate{today.year - m_options.monthlyLookbackYears, 1, 1};
        range.end = firstOfMonth(today);
    } else {
        range.start = addDays(today, -m_options.dailyLookbackDays);
        range.end = today;
    }
    return range;
}

std::string NasaPowerProvider::buildUrl(double latitude, double longitude,
                                        const DateRange& range, Mode mode) const {
    std::string joined;
    for (const auto& p : parameters()) {
        if (!joined.empty()) joined += ',';
        joined += p;
    }

    std::string path = mode == Mode::Monthly ? "/api/temporal/monthly/point"
                                             : "/api/temporal/daily/point";
    return m_options.baseUrl + path + "?" + net::buildQuery({
        {"parameters", joined},
        {"community", "RE"},
        {"longitude", formatCoordinate(longitude)},
        {"latitude", formatCoordinate(latitude)},
        {"start", compactDate(range.start, mode)},
        {"end", compactDate(range.end, mode)},
        {"format", "JSON"}
    });
}

RawSeries NasaPowerProvider::fetch(double latitude, double longitude,
                                   const DateRange& range, Mode mode) {
    if (mode == Mode::Unrelated) {
        throw ValidationError("No environmental data for unrelated requests");
    }

    net::HttpRequest request;
    request.url = buildUrl(latitude, longitude, range, mode);
    request.timeout = m_options.timeout;
    request.headers["Accept"] = "application/json";

    LOG_INFO("Fetching " + forecast::modeToString(mode) + " NASA POWER data " +
             toIsoString(range.start) + " .. " + toIsoString(range.end));

    net::HttpResponse response;
    try {
        response = m_transport->send(request);
    } catch (const TransportError& e) {
        throw ProviderError(std::string("NASA POWER unreachable: ") + e.what());
    }

    if (!response.ok()) {
        throw ProviderError("NASA POWER returned HTTP " + std::to_string(response.status));
    }

    RawSeries series = parse(response.body, mode, range);
    if (series.empty()) {
        throw ProviderError("NASA POWER returned no " + forecast::modeToString(mode) + " rows");
    }

    LOG_INFO("Fetched " + std::to_string(series.rowCount()) + " rows");
    return series;
}

RawSeries NasaPowerProvider::parse(const std::string& body, Mode mode, const DateRange& range) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ProviderError(std::string("Invalid NASA POWER JSON: ") + e.what());
    }

    // Rows keyed by date, sorted
    std::map<CivilDate, std::unordered_map<std::string, double>> rows;

    try {
        const json& parameters = doc.at("properties").at("parameter");
        for (const auto& [field, values] : parameters.items()) {
            for (const auto& [key, value] : values.items()) {
                if (mode == Mode::Monthly) {
                    if (key.size() != 6 || key.substr(4, 2) == "13") continue;
                } else if (key.size() != 8) {
                    continue;
                }

                CivilDate date;
                try {
                    date = parseDate(key);
                } catch (const ValidationError&) {
                    LOG_DEBUG("Skipping NASA POWER key " + key);
                    continue;
                }
                if (date < range.start || range.end < date) continue;

                rows[date][field] = value.is_number() ? value.get<double>() : RawSeries::kMissingSentinel;
            }
        }
    } catch (const json::exception& e) {
        throw ProviderError(std::string("Unexpected NASA POWER document: ") + e.what());
    }

    RawSeries series;
    for (const auto& [date, values] : rows) {
        // Periods not yet processed by POWER report the fill value everywhere
        bool anyValue = false;
        for (const auto& [field, value] : values) {
            if (value != RawSeries::kMissingSentinel) {
                anyValue = true;
                break;
            }
        }
        if (!anyValue) continue;
        series.addRow(date, values);
    }
    return series;
}

} // namespace provider
} // namespace rainsight
