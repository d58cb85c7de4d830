#include "config/AppConfig.hpp"
#include "core/Errors.hpp"
#include "net/HttpClient.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace rainsight {
namespace config {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string stripAt(const std::string& path) {
    return !path.empty() && path[0] == '@' ? path.substr(1) : path;
}

std::chrono::milliseconds parseMillis(const std::string& key, const std::string& value) {
    return std::chrono::milliseconds(parseInt(key, value, 0, 10 * 60 * 1000));
}

std::string requireNonEmpty(const std::string& key, const std::string& value) {
    if (value.empty()) {
        throw ValidationError("Configuration key " + key + " must not be empty");
    }
    return value;
}

/**
 * http(s) URL, checked once here so a typo fails startup
 */
std::string requireUrl(const std::string& key, const std::string& value) {
    try {
        net::Url::parse(requireNonEmpty(key, value));
    } catch (const ValidationError& e) {
        throw ValidationError("Configuration key " + key + ": " + e.what());
    }
    return value;
}

} // anonymous namespace

// =============================================================================
// Value parsers
// =============================================================================

int parseInt(const std::string& key, const std::string& value, int min, int max) {
    size_t consumed = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw ValidationError("Invalid integer for " + key + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ValidationError("Invalid integer for " + key + ": '" + value + "'");
    }
    if (parsed < min || parsed > max) {
        throw ValidationError(key + " must be between " + std::to_string(min) + " and " +
                              std::to_string(max) + ", got " + value);
    }
    return static_cast<int>(parsed);
}

double parseDouble(const std::string& key, const std::string& value, double min, double max) {
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ValidationError("Invalid number for " + key + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ValidationError("Invalid number for " + key + ": '" + value + "'");
    }
    if (!(parsed >= min && parsed <= max)) {
        throw ValidationError(key + " out of range: " + value);
    }
    return parsed;
}

bool parseBool(const std::string& key, const std::string& value) {
    std::string v = lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw ValidationError("Invalid boolean for " + key + ": '" + value + "'");
}

// =============================================================================
// Files
// =============================================================================

std::map<std::string, std::string> readParamsFile(const std::string& path) {
    std::string filePath = stripAt(path);
    std::ifstream paramFile(filePath);
    if (!paramFile.is_open()) {
        throw ValidationError("Cannot open config file: " + filePath);
    }

    std::map<std::string, std::string> params;
    std::string line;
    int lineNumber = 0;
    while (std::getline(paramFile, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ValidationError(filePath + ":" + std::to_string(lineNumber) + ": expected key=value");
        }
        std::string key = trim(line.substr(0, eq));
        if (key.empty()) {
            throw ValidationError(filePath + ":" + std::to_string(lineNumber) + ": empty key");
        }
        params[key] = trim(line.substr(eq + 1));
    }
    return params;
}

std::string resolveConnectionString(const std::string& value) {
    if (value.empty() || value[0] != '@') {
        return value;
    }

    std::string configPath = value.substr(1);
    std::ifstream configFile(configPath);
    if (!configFile.is_open()) {
        throw ValidationError("Cannot open PostgreSQL config file: " + configPath);
    }

    // Une ligne par paramètre
    std::string connString;
    std::string line;
    while (std::getline(configFile, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (!connString.empty()) connString += " ";
        connString += line;
    }
    if (connString.empty()) {
        throw ValidationError("PostgreSQL config file is empty: " + configPath);
    }
    return connString;
}

// =============================================================================
// AppConfig
// =============================================================================

void AppConfig::apply(const std::map<std::string, std::string>& params) {
    for (const auto& [key, value] : params) {
        if (key == "server.address") {
            address = requireNonEmpty(key, value);
        } else if (key == "server.port") {
            port = static_cast<unsigned short>(parseInt(key, value, 1, 65535));
        } else if (key == "workers") {
            workers = static_cast<size_t>(parseInt(key, value, 1, 256));
        } else if (key == "log.level") {
            auto level = server::Logger::levelFromString(value);
            if (!level) {
                throw ValidationError("Invalid log level: '" + value + "' (debug, info, warn, error)");
            }
            logLevel = *level;
        } else if (key == "log.file") {
            logFile = value;
        } else if (key == "storage.sqlite") {
            sqlitePath = requireNonEmpty(key, value);
        } else if (key == "storage.postgres") {
            postgresConnection = resolveConnectionString(value);
        } else if (key == "llm.api_key") {
            llm.apiKey = value;
        } else if (key == "llm.endpoint") {
            llm.endpoint = requireUrl(key, value);
        } else if (key == "llm.model") {
            llm.model = requireNonEmpty(key, value);
        } else if (key == "llm.timeout_ms") {
            llm.timeout = parseMillis(key, value);
        } else if (key == "provider.base_url") {
            provider.baseUrl = requireUrl(key, value);
        } else if (key == "provider.daily_lookback_days") {
            provider.dailyLookbackDays = parseInt(key, value, 1, 3650);
        } else if (key == "provider.monthly_lookback_years") {
            provider.monthlyLookbackYears = parseInt(key, value, 1, 50);
        } else if (key == "provider.timeout_ms") {
            provider.timeout = parseMillis(key, value);
        } else if (key == "publish.base_url") {
            // Empty leaves publishing off
            publish.baseUrl = value.empty() ? value : requireUrl(key, value);
        } else if (key == "publish.enabled") {
            publishEnabled = parseBool(key, value);
        } else if (key == "publish.interactive") {
            publishInteractive = parseBool(key, value);
        } else if (key == "publish.max_attempts") {
            publish.maxAttempts = parseInt(key, value, 1, 10);
        } else if (key == "publish.retry_delay_ms") {
            publish.retryDelay = parseMillis(key, value);
        } else if (key == "publish.timeout_ms") {
            publish.timeout = parseMillis(key, value);
        } else if (key == "artifacts.daily") {
            dailyArtifacts = requireNonEmpty(key, value);
        } else if (key == "artifacts.monthly") {
            monthlyArtifacts = requireNonEmpty(key, value);
        } else if (key == "location.latitude") {
            latitude = parseDouble(key, value, -90.0, 90.0);
        } else if (key == "location.longitude") {
            longitude = parseDouble(key, value, -180.0, 180.0);
        } else if (key == "bucket.week_anchor") {
            weekAnchor = forecast::weekAnchorFromString(value);
        } else {
            LOG_WARN("Ignoring unknown configuration key: " + key);
        }
    }
}

AppConfig AppConfig::fromArgs(int argc, const char* const argv[]) {
    AppConfig config;
    std::map<std::string, std::string> cli;

    auto next = [&](int& i, const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            throw ValidationError("Missing value for " + option);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-p" || arg == "--port") {
            cli["server.port"] = next(i, arg);
        } else if (arg == "-a" || arg == "--address") {
            cli["server.address"] = next(i, arg);
        } else if (arg == "-l" || arg == "--log-level") {
            cli["log.level"] = next(i, arg);
        } else if (arg == "--config") {
            config.configFile = next(i, arg);
        } else if (arg == "--sqlite") {
            cli["storage.sqlite"] = next(i, arg);
        } else if (arg == "--postgres") {
            cli["storage.postgres"] = next(i, arg);
        } else if (arg == "--run-scheduled") {
            std::string mode = next(i, arg);
            auto parsed = forecast::modeFromString(mode);
            if (parsed == forecast::Mode::Unrelated) {
                throw ValidationError("--run-scheduled expects daily or monthly");
            }
            config.runScheduled = parsed;
        } else if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
            return config;
        } else {
            throw ValidationError("Unknown option: " + arg);
        }
    }

    if (!config.configFile.empty()) {
        config.apply(readParamsFile(config.configFile));
    }
    config.apply(cli);

    if (config.llm.apiKey.empty()) {
        if (const char* key = std::getenv("OPENAI_API_KEY")) {
            config.llm.apiKey = key;
        }
    }

    return config;
}

std::string AppConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  -p, --port PORT          Port to listen on (default: 8080)\n"
        << "  -a, --address ADDR       Address to bind to (default: 0.0.0.0)\n"
        << "  -l, --log-level LVL      Log level: debug, info, warn, error (default: info)\n"
        << "  --config FILE            Parameters file (key=value lines, @file syntax)\n"
        << "  --sqlite PATH            SQLite database (default: rainsight.db)\n"
        << "  --postgres CONN          PostgreSQL connection string or path to config file\n"
        << "                           String: \"host=localhost port=5432 dbname=rainsight user=postgres\"\n"
        << "                           File: @/path/to/postgres.conf (one param per line)\n"
        << "  --run-scheduled MODE     Run one daily|monthly chart refresh and exit\n"
        << "  -h, --help               Show this help\n";
    return out.str();
}

} // namespace config
} // namespace rainsight
