#include "config/AppConfig.hpp"
#include "core/Errors.hpp"
#include "forecast/ModelArtifacts.hpp"
#include "llm/IntentClassifier.hpp"
#include "llm/LanguageModel.hpp"
#include "llm/Summarizer.hpp"
#include "net/HttpClient.hpp"
#include "pipeline/SessionDispatcher.hpp"
#include "pipeline/WorkflowEngine.hpp"
#include "postgres/PostgresRecordStore.hpp"
#include "provider/DataProvider.hpp"
#include "publish/Publisher.hpp"
#include "server/HttpServer.hpp"
#include "server/Logger.hpp"
#include "server/RequestHandler.hpp"
#include "storage/SqliteRecordStore.hpp"
#include <iostream>

using namespace rainsight;
using namespace rainsight::server;

namespace {
    std::shared_ptr<storage::IRecordStore> openStore(const config::AppConfig& appConfig) {
        if (!appConfig.postgresConnection.empty()) {
            auto store = std::make_shared<postgres::PostgresRecordStore>(appConfig.postgresConnection);
            LOG_INFO("PostgreSQL configured: " + store->redactedConnectionString());
            return store;
        }
        LOG_INFO("SQLite database: " + appConfig.sqlitePath);
        return std::make_shared<storage::SqliteRecordStore>(appConfig.sqlitePath);
    }

    std::shared_ptr<pipeline::WorkflowEngine> buildEngine(const config::AppConfig& appConfig,
                                                          std::shared_ptr<storage::IRecordStore> store) {
        auto transport = std::make_shared<rainsight::net::BeastHttpTransport>();

        auto model = std::make_shared<llm::OpenAiChatModel>(appConfig.llm, transport);
        if (!model->available()) {
            LOG_WARN("No language model key configured, using keyword classification and local summaries");
        }

        llm::ClassifierOptions classifierOptions;
        classifierOptions.latitude = appConfig.latitude;
        classifierOptions.longitude = appConfig.longitude;

        auto artifacts = std::make_shared<forecast::ArtifactRegistry>();
        artifacts->add(forecast::ArtifactLoader::loadFile(appConfig.dailyArtifacts, forecast::Mode::Daily));
        artifacts->add(forecast::ArtifactLoader::loadFile(appConfig.monthlyArtifacts, forecast::Mode::Monthly));
        LOG_INFO("Model artifacts loaded");

        pipeline::WorkflowCapabilities caps;
        caps.classifier = std::make_shared<llm::IntentClassifier>(model, classifierOptions);
        caps.provider = std::make_shared<provider::NasaPowerProvider>(appConfig.provider, transport);
        caps.artifacts = artifacts;
        caps.summarizer = std::make_shared<llm::Summarizer>(model);
        caps.store = std::move(store);

        if (appConfig.publishEnabled && !appConfig.publish.baseUrl.empty()) {
            caps.publisher = std::make_shared<publish::Publisher>(appConfig.publish, transport);
            LOG_INFO("Publishing to " + appConfig.publish.baseUrl);
        } else {
            LOG_WARN("Publishing disabled");
        }

        pipeline::WorkflowOptions options;
        options.publishInteractive = appConfig.publishInteractive;
        options.weekAnchor = appConfig.weekAnchor;
        options.latitude = appConfig.latitude;
        options.longitude = appConfig.longitude;

        return std::make_shared<pipeline::WorkflowEngine>(std::move(caps), options);
    }
}

int main(int argc, char* argv[]) {
    config::AppConfig appConfig;
    try {
        appConfig = config::AppConfig::fromArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << config::AppConfig::usage(argv[0]);
        return 1;
    }

    if (appConfig.showHelp) {
        std::cout << config::AppConfig::usage(argv[0]);
        return 0;
    }

    try {
        // Configure Logger
        Logger::instance().setLevel(appConfig.logLevel);
        if (!appConfig.logFile.empty() && !Logger::instance().enableFileLogging(appConfig.logFile)) {
            std::cerr << "Error: Cannot open log file: " << appConfig.logFile << std::endl;
            return 1;
        }

        std::cout << "=== RainSight ===" << std::endl;
        std::cout << std::endl;

        auto store = openStore(appConfig);
        auto engine = buildEngine(appConfig, store);

        // One-shot chart refresh
        if (appConfig.runScheduled) {
            auto result = engine->runScheduled(*appConfig.runScheduled);
            std::cout << result.toJson().dump(2) << std::endl;
            return result.success ? 0 : 2;
        }

        auto dispatcher = std::make_shared<pipeline::SessionDispatcher>(engine, appConfig.workers);
        RequestHandler::instance().configure(store, dispatcher);

        HttpServer server(appConfig.address, appConfig.port);

        std::cout << std::endl;
        std::cout << "Endpoints:" << std::endl;
        std::cout << "  GET  /api/health                       - Health check" << std::endl;
        std::cout << "  POST /api/user_input                   - Submit a rainfall question" << std::endl;
        std::cout << "  GET  /api/chatbot_response?user_id=N   - Latest answer for a user" << std::endl;
        std::cout << "  GET  /api/forecast/latest?type=T       - Latest stored daily|monthly chart" << std::endl;
        std::cout << "  POST /admin/update-weekly-chart        - Refresh the daily chart" << std::endl;
        std::cout << "  POST /admin/update-monthly-chart       - Refresh the monthly chart" << std::endl;
        std::cout << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;
        std::cout << std::endl;

        // Blocks until SIGINT/SIGTERM
        server.run();

        // Let running sessions write their answer
        LOG_INFO("Waiting for " + std::to_string(dispatcher->pendingCount()) + " pending session(s)");
        dispatcher->wait();

    } catch (const ValidationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
