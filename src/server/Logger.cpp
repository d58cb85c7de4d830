#include "server/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace rainsight {
namespace server {

namespace {

constexpr size_t kMaxLoggedBody = 500;

std::string utcTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string clip(const std::string& body) {
    if (body.size() <= kMaxLoggedBody) {
        return body;
    }
    return body.substr(0, kMaxLoggedBody) + "... (" + std::to_string(body.size()) + " bytes)";
}

} // anonymous namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

bool Logger::enableFileLogging(const std::string& filepath) {
    std::ofstream file(filepath, std::ios::app);
    if (!file.is_open()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file = std::move(file);
    return true;
}

std::ostream& Logger::output() {
    if (m_file.is_open()) {
        return m_file;
    }
    return std::cout;
}

void Logger::write(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;
    ++m_counts[static_cast<size_t>(level)];

    std::string line = utcTimestamp() + " " + levelName(level) + " " + message;
    std::lock_guard<std::mutex> lock(m_mutex);
    output() << line << std::endl;
}

uint64_t Logger::count(LogLevel level) const {
    return m_counts[static_cast<size_t>(level)].load();
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

std::optional<LogLevel> Logger::levelFromString(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

RequestLog Logger::beginRequest(const std::string& method, const std::string& target, const std::string& body) {
    RequestLog request{++m_nextRequestId, std::chrono::steady_clock::now()};

    std::string line = "[REQ-" + std::to_string(request.id) + "] " + method + " " + target;
    if (!body.empty() && enabled(LogLevel::DEBUG)) {
        line += " | " + clip(body);
    }
    write(LogLevel::INFO, line);
    return request;
}

void Logger::endRequest(const RequestLog& request, unsigned status, const std::string& body) {
    double elapsedMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - request.start).count();

    std::ostringstream oss;
    oss << "[REQ-" << request.id << "] " << status
        << " in " << std::fixed << std::setprecision(1) << elapsedMs << "ms"
        << " (" << body.size() << " bytes)";
    if (!body.empty() && enabled(LogLevel::DEBUG)) {
        oss << " | " << clip(body);
    }
    write(LogLevel::INFO, oss.str());
}

} // namespace server
} // namespace rainsight
