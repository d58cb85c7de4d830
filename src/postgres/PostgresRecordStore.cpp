#include "postgres/PostgresRecordStore.hpp"
#include "core/Calendar.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <sstream>

namespace rainsight {
namespace postgres {

using storage::ForecastRecord;
using storage::QueryRecord;

namespace {

void createTables(pqxx::connection& conn) {
    pqxx::work txn(conn);
    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS user_queries (
            id BIGSERIAL PRIMARY KEY,
            user_id BIGINT NOT NULL,
            query_text TEXT NOT NULL,
            response_text TEXT,
            response_time TEXT,
            created_at TEXT NOT NULL,
            completed BOOLEAN NOT NULL DEFAULT FALSE
        )
    )");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_queries_user ON user_queries(user_id, id DESC)");
    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS forecasts (
            id BIGSERIAL PRIMARY KEY,
            forecast_type TEXT NOT NULL,
            forecast_data TEXT NOT NULL,
            created_at TEXT NOT NULL
        )
    )");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_forecasts_type ON forecasts(forecast_type, id DESC)");
    txn.commit();
}

std::optional<std::string> optionalText(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<std::string>();
}

QueryRecord readQuery(const pqxx::row& row) {
    QueryRecord record;
    record.id = row[0].as<int64_t>();
    record.userId = row[1].as<int64_t>();
    record.queryText = row[2].as<std::string>();
    record.responseText = optionalText(row[3]);
    record.responseTime = optionalText(row[4]);
    record.createdAt = row[5].as<std::string>();
    record.completed = row[6].as<bool>();
    return record;
}

ForecastRecord readForecast(const pqxx::row& row) {
    ForecastRecord record;
    record.id = row[0].as<int64_t>();
    record.mode = forecast::modeFromString(row[1].as<std::string>());
    try {
        record.payload = nlohmann::json::parse(row[2].as<std::string>());
    } catch (const nlohmann::json::parse_error& e) {
        throw PersistenceError("Corrupted forecast payload #" + std::to_string(record.id) + ": " + e.what());
    }
    record.createdAt = row[3].as<std::string>();
    return record;
}

const char* kQueryColumns =
    "SELECT id, user_id, query_text, response_text, response_time, created_at, completed "
    "FROM user_queries ";

/**
 * Session bound to one pqxx::connection
 */
class PostgresStoreSession : public storage::IStoreSession {
public:
    explicit PostgresStoreSession(std::unique_ptr<pqxx::connection> conn)
        : m_conn(std::move(conn))
    {}

    QueryRecord createQuery(int64_t userId, const std::string& text) override {
        return run("createQuery", [&](pqxx::work& txn) {
            QueryRecord record;
            record.userId = userId;
            record.queryText = text;
            record.createdAt = currentTimestamp();

            pqxx::result result = txn.exec_params(
                "INSERT INTO user_queries (user_id, query_text, created_at, completed) "
                "VALUES ($1, $2, $3, FALSE) RETURNING id",
                userId, text, record.createdAt);
            record.id = result[0][0].as<int64_t>();
            return record;
        });
    }

    std::optional<QueryRecord> getQuery(int64_t id) override {
        return run("getQuery", [&](pqxx::work& txn) -> std::optional<QueryRecord> {
            pqxx::result result = txn.exec_params(std::string(kQueryColumns) + "WHERE id = $1", id);
            if (result.empty()) return std::nullopt;
            return readQuery(result[0]);
        });
    }

    std::optional<QueryRecord> latestQueryForUser(int64_t userId) override {
        return run("latestQueryForUser", [&](pqxx::work& txn) -> std::optional<QueryRecord> {
            pqxx::result result = txn.exec_params(
                std::string(kQueryColumns) + "WHERE user_id = $1 ORDER BY id DESC LIMIT 1", userId);
            if (result.empty()) return std::nullopt;
            return readQuery(result[0]);
        });
    }

    void saveResponse(int64_t id, const std::string& text) override {
        auto affected = run("saveResponse", [&](pqxx::work& txn) {
            pqxx::result result = txn.exec_params(
                "UPDATE user_queries SET response_text = $1, response_time = $2, completed = TRUE "
                "WHERE id = $3",
                text, currentTimestamp(), id);
            return result.affected_rows();
        });
        if (affected == 0) {
            throw PersistenceError("Query not found: " + std::to_string(id));
        }
    }

    ForecastRecord saveForecast(const forecast::BucketedForecast& bucket) override {
        return run("saveForecast", [&](pqxx::work& txn) {
            ForecastRecord record;
            record.mode = bucket.mode;
            record.payload = bucket.toJson();
            record.createdAt = currentTimestamp();

            pqxx::result result = txn.exec_params(
                "INSERT INTO forecasts (forecast_type, forecast_data, created_at) "
                "VALUES ($1, $2, $3) RETURNING id",
                forecast::modeToString(record.mode), record.payload.dump(), record.createdAt);
            record.id = result[0][0].as<int64_t>();
            return record;
        });
    }

    std::optional<ForecastRecord> latestForecast(forecast::Mode mode) override {
        return run("latestForecast", [&](pqxx::work& txn) -> std::optional<ForecastRecord> {
            pqxx::result result = txn.exec_params(
                "SELECT id, forecast_type, forecast_data, created_at FROM forecasts "
                "WHERE forecast_type = $1 ORDER BY id DESC LIMIT 1",
                forecast::modeToString(mode));
            if (result.empty()) return std::nullopt;
            return readForecast(result[0]);
        });
    }

private:
    /**
     * Runs `body` in its own transaction, pqxx failures become PersistenceError
     */
    template <class Body>
    auto run(const char* operation, Body&& body) {
        try {
            pqxx::work txn(*m_conn);
            auto result = body(txn);
            txn.commit();
            return result;
        } catch (const pqxx::sql_error& e) {
            LOG_ERROR(std::string("PostgreSQL ") + operation + " failed: " + e.what());
            throw PersistenceError(std::string("SQL error: ") + e.what());
        } catch (const pqxx::failure& e) {
            LOG_ERROR(std::string("PostgreSQL ") + operation + " failed: " + e.what());
            throw PersistenceError(std::string("PostgreSQL failure: ") + e.what());
        }
    }

    std::unique_ptr<pqxx::connection> m_conn;
};

} // anonymous namespace

PostgresRecordStore::PostgresRecordStore(std::string connectionString)
    : m_connectionString(std::move(connectionString))
{
    if (m_connectionString.empty()) {
        throw ValidationError("PostgreSQL connection string is empty");
    }
    LOG_INFO("PostgreSQL record store configured: " + redactedConnectionString());
}

std::string PostgresRecordStore::redactedConnectionString() const {
    std::istringstream iss(m_connectionString);
    std::string token;
    std::string result;
    while (iss >> token) {
        if (token.rfind("password=", 0) == 0) {
            token = "password=***";
        }
        if (!result.empty()) result += ' ';
        result += token;
    }
    return result;
}

std::unique_ptr<storage::IStoreSession> PostgresRecordStore::openSession() {
    std::unique_ptr<pqxx::connection> conn;
    try {
        conn = std::make_unique<pqxx::connection>(m_connectionString);
        if (!conn->is_open()) {
            throw PersistenceError("Failed to open PostgreSQL connection");
        }
        std::lock_guard<std::mutex> lock(m_schemaMutex);
        if (!m_schemaReady) {
            createTables(*conn);
            m_schemaReady = true;
        }
    } catch (const pqxx::failure& e) {
        throw PersistenceError(std::string("PostgreSQL connection failed: ") + e.what());
    }
    return std::make_unique<PostgresStoreSession>(std::move(conn));
}

} // namespace postgres
} // namespace rainsight
