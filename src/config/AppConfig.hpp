#pragma once

#include "forecast/ResultBucketer.hpp"
#include "forecast/Types.hpp"
#include "llm/LanguageModel.hpp"
#include "provider/DataProvider.hpp"
#include "publish/Publisher.hpp"
#include "server/Logger.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rainsight {
namespace config {

/**
 * Startup configuration: command line plus key=value parameter file
 *
 * Every parsing problem throws ValidationError, main() turns it into exit
 * code 1.
 */
struct AppConfig {
    // Server
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    size_t workers = 4;

    // Logging
    server::LogLevel logLevel = server::LogLevel::INFO;
    std::string logFile;

    // Persistence (PostgreSQL wins when set)
    std::string sqlitePath = "rainsight.db";
    std::string postgresConnection;

    // Collaborators
    llm::OpenAiOptions llm;
    provider::NasaPowerOptions provider;
    publish::PublisherOptions publish;
    bool publishEnabled = true;
    bool publishInteractive = true;

    std::string dailyArtifacts = "models/daily.json";
    std::string monthlyArtifacts = "models/monthly.json";

    double latitude = 6.585;
    double longitude = 3.983;
    forecast::WeekAnchor weekAnchor = forecast::WeekAnchor::Current;

    // One-shot mode
    std::optional<forecast::Mode> runScheduled;
    bool showHelp = false;

    std::string configFile;

    /**
     * Parse argv, then the parameter file named by --config. Command-line
     * values override the file. OPENAI_API_KEY is used when llm.api_key is
     * absent.
     */
    static AppConfig fromArgs(int argc, const char* const argv[]);

    /**
     * Apply parameter-file keys. Unknown keys are logged and ignored.
     */
    void apply(const std::map<std::string, std::string>& params);

    static std::string usage(const std::string& program);
};

/**
 * Read `key=value` lines ('#' comments, values trimmed). A leading '@' on
 * the path is accepted.
 */
std::map<std::string, std::string> readParamsFile(const std::string& path);

/**
 * Connection string given inline or as @file (one parameter per line)
 */
std::string resolveConnectionString(const std::string& value);

// Value parsers, throw ValidationError naming the key
int parseInt(const std::string& key, const std::string& value, int min, int max);
double parseDouble(const std::string& key, const std::string& value, double min, double max);
bool parseBool(const std::string& key, const std::string& value);

} // namespace config
} // namespace rainsight
