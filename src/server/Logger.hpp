#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace rainsight {
namespace server {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Handle tying a request line to its response line
 */
struct RequestLog {
    uint64_t id = 0;
    std::chrono::steady_clock::time_point start;
};

/**
 * Logger singleton - gestion centralisée des logs
 *
 * Lines are written to stdout, or appended to a file once
 * enableFileLogging() succeeded. Shared by the HTTP sessions and the
 * pipeline workers.
 *
 *   2024-06-05T08:12:44.031Z INFO  [session 12] Forecast ready
 */
class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level) { m_level = level; }
    LogLevel level() const { return m_level; }
    bool enabled(LogLevel level) const { return level >= m_level.load(); }

    /**
     * Switch output to `filepath` (append). Returns false and keeps the
     * current output if the file cannot be opened.
     */
    bool enableFileLogging(const std::string& filepath);

    void write(LogLevel level, const std::string& message);

    /// Lines written at `level` since startup
    uint64_t count(LogLevel level) const;

    // HTTP traffic, bodies only appear at DEBUG
    RequestLog beginRequest(const std::string& method, const std::string& target, const std::string& body);
    void endRequest(const RequestLog& request, unsigned status, const std::string& body);

    static std::string levelName(LogLevel level);
    static std::optional<LogLevel> levelFromString(const std::string& name);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ostream& output();

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ofstream m_file;
    std::mutex m_mutex;

    std::atomic<uint64_t> m_nextRequestId{0};
    std::array<std::atomic<uint64_t>, 4> m_counts{};
};

#define RAINSIGHT_LOG(level, msg)                                          \
    do {                                                                   \
        auto& rainsightLogger_ = ::rainsight::server::Logger::instance();  \
        if (rainsightLogger_.enabled(level)) {                             \
            rainsightLogger_.write(level, msg);                            \
        }                                                                  \
    } while (0)

#define LOG_DEBUG(msg) RAINSIGHT_LOG(::rainsight::server::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) RAINSIGHT_LOG(::rainsight::server::LogLevel::INFO, msg)
#define LOG_WARN(msg) RAINSIGHT_LOG(::rainsight::server::LogLevel::WARN, msg)
#define LOG_ERROR(msg) RAINSIGHT_LOG(::rainsight::server::LogLevel::ERROR, msg)

} // namespace server
} // namespace rainsight
