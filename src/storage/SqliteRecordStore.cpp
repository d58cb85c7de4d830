#include "storage/SqliteRecordStore.hpp"
#include "core/Calendar.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <sqlite3.h>

namespace rainsight {
namespace storage {

namespace {

// =============================================================================
// RAII Statement wrapper
// =============================================================================

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw PersistenceError("Failed to prepare statement: " +
                                   std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindInt64(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw PersistenceError("Step failed: " +
                               std::string(sqlite3_errmsg(sqlite3_db_handle(m_stmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    std::optional<std::string> getOptionalText(int col) {
        if (isNull(col)) return std::nullopt;
        return getText(col);
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

    bool isNull(int col) {
        return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
    }

private:
    sqlite3_stmt* m_stmt;
};

// =============================================================================
// Connection
// =============================================================================

class Connection {
public:
    Connection(const std::string& dbPath, std::chrono::milliseconds busyTimeout) : m_db(nullptr) {
        if (sqlite3_open(dbPath.c_str(), &m_db) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            if (m_db) sqlite3_close(m_db);
            throw PersistenceError("Failed to open database " + dbPath + ": " + error);
        }
        sqlite3_busy_timeout(m_db, static_cast<int>(busyTimeout.count()));
        try {
            exec("PRAGMA journal_mode = WAL");
        } catch (const PersistenceError&) {
            sqlite3_close(m_db);
            throw;
        }
    }

    ~Connection() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    sqlite3* get() { return m_db; }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw PersistenceError("SQL error: " + error);
        }
    }

private:
    sqlite3* m_db;
};

void createTables(Connection& conn) {
    conn.exec(R"(
        CREATE TABLE IF NOT EXISTS user_queries (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id INTEGER NOT NULL,
            query_text TEXT NOT NULL,
            response_text TEXT,
            response_time TEXT,
            created_at TEXT NOT NULL,
            completed INTEGER NOT NULL DEFAULT 0
        )
    )");

    conn.exec("CREATE INDEX IF NOT EXISTS idx_queries_user ON user_queries(user_id, id DESC)");

    conn.exec(R"(
        CREATE TABLE IF NOT EXISTS forecasts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            forecast_type TEXT NOT NULL,
            forecast_data TEXT NOT NULL,
            created_at TEXT NOT NULL
        )
    )");

    conn.exec("CREATE INDEX IF NOT EXISTS idx_forecasts_type ON forecasts(forecast_type, id DESC)");
}

// Column order: id, user_id, query_text, response_text, response_time, created_at, completed
QueryRecord readQuery(Statement& stmt) {
    QueryRecord record;
    record.id = stmt.getInt64(0);
    record.userId = stmt.getInt64(1);
    record.queryText = stmt.getText(2);
    record.responseText = stmt.getOptionalText(3);
    record.responseTime = stmt.getOptionalText(4);
    record.createdAt = stmt.getText(5);
    record.completed = stmt.getInt64(6) != 0;
    return record;
}

// Column order: id, forecast_type, forecast_data, created_at
ForecastRecord readForecast(Statement& stmt) {
    ForecastRecord record;
    record.id = stmt.getInt64(0);
    record.mode = forecast::modeFromString(stmt.getText(1));
    try {
        record.payload = nlohmann::json::parse(stmt.getText(2));
    } catch (const nlohmann::json::parse_error& e) {
        throw PersistenceError("Corrupted forecast payload #" + std::to_string(record.id) + ": " + e.what());
    }
    record.createdAt = stmt.getText(3);
    return record;
}

const char* kQueryColumns =
    "SELECT id, user_id, query_text, response_text, response_time, created_at, completed "
    "FROM user_queries ";

// =============================================================================
// Session
// =============================================================================

class SqliteStoreSession : public IStoreSession {
public:
    SqliteStoreSession(const std::string& dbPath, std::chrono::milliseconds busyTimeout)
        : m_conn(dbPath, busyTimeout)
    {}

    QueryRecord createQuery(int64_t userId, const std::string& text) override {
        QueryRecord record;
        record.userId = userId;
        record.queryText = text;
        record.createdAt = currentTimestamp();

        Statement stmt(m_conn.get(),
            "INSERT INTO user_queries (user_id, query_text, created_at, completed) VALUES (?, ?, ?, 0)");
        stmt.bindInt64(1, userId);
        stmt.bindText(2, text);
        stmt.bindText(3, record.createdAt);
        stmt.step();

        record.id = sqlite3_last_insert_rowid(m_conn.get());
        return record;
    }

    std::optional<QueryRecord> getQuery(int64_t id) override {
        Statement stmt(m_conn.get(), std::string(kQueryColumns) + "WHERE id = ?");
        stmt.bindInt64(1, id);
        if (!stmt.step()) return std::nullopt;
        return readQuery(stmt);
    }

    std::optional<QueryRecord> latestQueryForUser(int64_t userId) override {
        Statement stmt(m_conn.get(), std::string(kQueryColumns) + "WHERE user_id = ? ORDER BY id DESC LIMIT 1");
        stmt.bindInt64(1, userId);
        if (!stmt.step()) return std::nullopt;
        return readQuery(stmt);
    }

    void saveResponse(int64_t id, const std::string& text) override {
        Statement stmt(m_conn.get(),
            "UPDATE user_queries SET response_text = ?, response_time = ?, completed = 1 WHERE id = ?");
        stmt.bindText(1, text);
        stmt.bindText(2, currentTimestamp());
        stmt.bindInt64(3, id);
        stmt.step();

        if (sqlite3_changes(m_conn.get()) == 0) {
            throw PersistenceError("Query not found: " + std::to_string(id));
        }
    }

    ForecastRecord saveForecast(const forecast::BucketedForecast& bucket) override {
        ForecastRecord record;
        record.mode = bucket.mode;
        record.payload = bucket.toJson();
        record.createdAt = currentTimestamp();

        Statement stmt(m_conn.get(),
            "INSERT INTO forecasts (forecast_type, forecast_data, created_at) VALUES (?, ?, ?)");
        stmt.bindText(1, forecast::modeToString(record.mode));
        stmt.bindText(2, record.payload.dump());
        stmt.bindText(3, record.createdAt);
        stmt.step();

        record.id = sqlite3_last_insert_rowid(m_conn.get());
        return record;
    }

    std::optional<ForecastRecord> latestForecast(forecast::Mode mode) override {
        Statement stmt(m_conn.get(),
            "SELECT id, forecast_type, forecast_data, created_at FROM forecasts "
            "WHERE forecast_type = ? ORDER BY id DESC LIMIT 1");
        stmt.bindText(1, forecast::modeToString(mode));
        if (!stmt.step()) return std::nullopt;
        return readForecast(stmt);
    }

private:
    Connection m_conn;
};

} // anonymous namespace

// =============================================================================
// SqliteRecordStore
// =============================================================================

SqliteRecordStore::SqliteRecordStore(const std::string& dbPath, std::chrono::milliseconds busyTimeout)
    : m_dbPath(dbPath)
    , m_busyTimeout(busyTimeout)
{
    Connection conn(m_dbPath, m_busyTimeout);
    createTables(conn);
    LOG_INFO("SQLite record store ready: " + m_dbPath);
}

std::unique_ptr<IStoreSession> SqliteRecordStore::openSession() {
    return std::make_unique<SqliteStoreSession>(m_dbPath, m_busyTimeout);
}

} // namespace storage
} // namespace rainsight
