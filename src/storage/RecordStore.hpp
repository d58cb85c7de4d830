#pragma once

#include "forecast/ResultBucketer.hpp"
#include "forecast/Types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace rainsight {
namespace storage {

/**
 * One user question and its eventual answer. The id doubles as the
 * pipeline session id.
 */
struct QueryRecord {
    int64_t id = 0;
    int64_t userId = 0;
    std::string queryText;
    std::optional<std::string> responseText;
    std::optional<std::string> responseTime;    // ISO 8601 UTC
    std::string createdAt;                      // ISO 8601 UTC
    bool completed = false;

    nlohmann::json toJson() const;
};

/**
 * Stored bucket (chart payload)
 */
struct ForecastRecord {
    int64_t id = 0;
    forecast::Mode mode = forecast::Mode::Daily;
    nlohmann::json payload;                     // [{"date", "rainfall"}, ...]
    std::string createdAt;

    nlohmann::json toJson() const;
};

/**
 * Connection-scoped access to the records
 *
 * All methods throw PersistenceError on database failures.
 */
class IStoreSession {
public:
    virtual ~IStoreSession() = default;

    virtual QueryRecord createQuery(int64_t userId, const std::string& text) = 0;
    virtual std::optional<QueryRecord> getQuery(int64_t id) = 0;
    virtual std::optional<QueryRecord> latestQueryForUser(int64_t userId) = 0;

    /**
     * Store the answer, set response_time and completed
     * Throws PersistenceError if the query does not exist
     */
    virtual void saveResponse(int64_t id, const std::string& text) = 0;

    virtual ForecastRecord saveForecast(const forecast::BucketedForecast& bucket) = 0;
    virtual std::optional<ForecastRecord> latestForecast(forecast::Mode mode) = 0;
};

/**
 * Factory of sessions. Each session owns its own connection and releases
 * it when destroyed, so one session per pipeline execution.
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;
    virtual std::unique_ptr<IStoreSession> openSession() = 0;
    virtual std::string backendName() const = 0;
};

} // namespace storage
} // namespace rainsight
