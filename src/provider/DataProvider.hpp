#pragma once

#include "core/Calendar.hpp"
#include "forecast/RawSeries.hpp"
#include "forecast/Types.hpp"
#include "net/HttpClient.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace rainsight {
namespace provider {

/**
 * Inclusive date range. For monthly requests only year and month matter.
 */
struct DateRange {
    CivilDate start;
    CivilDate end;
};

/**
 * Source of historical environmental observations
 */
class IDataProvider {
public:
    virtual ~IDataProvider() = default;

    /**
     * Throws ProviderError when the data cannot be obtained
     */
    virtual forecast::RawSeries fetch(double latitude, double longitude,
                                      const DateRange& range, forecast::Mode mode) = 0;

    /**
     * History window to request for a forecast issued on `today`
     */
    virtual DateRange lookback(forecast::Mode mode, const CivilDate& today) const = 0;
};

struct NasaPowerOptions {
    std::string baseUrl = "https://power.larc.nasa.gov";
    int dailyLookbackDays = 60;
    int monthlyLookbackYears = 3;
    std::chrono::milliseconds timeout{30000};
};

/**
 * NASA POWER point API (community RE, JSON)
 *
 * GET /api/temporal/{daily|monthly}/point?parameters=...&latitude=..&longitude=..&start=..&end=..
 * Daily keys are YYYYMMDD, monthly keys YYYYMM (month 13 is the annual
 * aggregate and is skipped). The -999 fill value is passed through, rows
 * carrying nothing but fill values are dropped.
 */
class NasaPowerProvider : public IDataProvider {
public:
    NasaPowerProvider(NasaPowerOptions options, std::shared_ptr<net::IHttpTransport> transport);

    forecast::RawSeries fetch(double latitude, double longitude,
                              const DateRange& range, forecast::Mode mode) override;

    DateRange lookback(forecast::Mode mode, const CivilDate& today) const override;

    std::string buildUrl(double latitude, double longitude,
                         const DateRange& range, forecast::Mode mode) const;

    /**
     * Rows of the response body within `range`, chronological
     * Throws ProviderError on malformed documents
     */
    static forecast::RawSeries parse(const std::string& body, forecast::Mode mode, const DateRange& range);

    /**
     * Requested parameters: model covariates then the target
     */
    static std::vector<std::string> parameters();

private:
    NasaPowerOptions m_options;
    std::shared_ptr<net::IHttpTransport> m_transport;
};

} // namespace provider
} // namespace rainsight
