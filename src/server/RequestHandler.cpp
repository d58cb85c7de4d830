#include "server/RequestHandler.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <charconv>

namespace rainsight {
namespace server {

namespace {

json errorBody(const std::string& message) {
    return json{{"status", "error"}, {"message", message}};
}

/**
 * Parse a base-10 integer, the whole string must be consumed
 */
std::optional<int64_t> parseId(const std::string& text) {
    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

/**
 * user_id is accepted as a JSON integer or a numeric string
 */
std::optional<int64_t> userIdFrom(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        return parseId(value.get<std::string>());
    }
    return std::nullopt;
}

} // anonymous namespace

RequestHandler& RequestHandler::instance() {
    static RequestHandler instance;
    return instance;
}

void RequestHandler::configure(std::shared_ptr<storage::IRecordStore> store,
                               std::shared_ptr<pipeline::SessionDispatcher> dispatcher) {
    m_store = std::move(store);
    m_dispatcher = std::move(dispatcher);
    if (m_store) {
        LOG_INFO("Request handler using " + m_store->backendName() + " store");
    }
}

std::optional<RouteResult> RequestHandler::notConfigured() const {
    if (isConfigured()) {
        return std::nullopt;
    }
    return RouteResult{503, errorBody("Service not ready")};
}

RouteResult RequestHandler::handleHealth() {
    json body{
        {"status", "ok"},
        {"service", "RainSight"},
        {"version", "1.0.0"},
        {"store", m_store ? m_store->backendName() : "none"},
        {"pending_sessions", m_dispatcher ? m_dispatcher->pendingCount() : 0},
        {"warnings_logged", Logger::instance().count(LogLevel::WARN)},
        {"errors_logged", Logger::instance().count(LogLevel::ERROR)}
    };
    return {200, body};
}

RouteResult RequestHandler::handleUserInput(const json& request) {
    if (auto unavailable = notConfigured()) {
        return *unavailable;
    }

    if (!request.is_object() || !request.contains("user_id") || !request.contains("message")) {
        return {400, errorBody("Expected {\"user_id\", \"message\"}")};
    }

    auto userId = userIdFrom(request["user_id"]);
    if (!userId) {
        return {400, errorBody("user_id must be an integer")};
    }
    if (!request["message"].is_string()) {
        return {400, errorBody("message must be a string")};
    }
    std::string message = request["message"].get<std::string>();
    if (message.find_first_not_of(" \t\r\n") == std::string::npos) {
        return {400, errorBody("message must not be empty")};
    }

    if (!m_dispatcher->accepting()) {
        return {503, errorBody("Service is shutting down")};
    }

    storage::QueryRecord record;
    {
        auto session = m_store->openSession();
        record = session->createQuery(*userId, message);
    }

    try {
        m_dispatcher->dispatchInteractive(record.id);
    } catch (const ValidationError& e) {
        // Shut down between the check and the dispatch: answer the record now
        LOG_WARN("Query " + std::to_string(record.id) + " not dispatched: " + e.what());
        m_store->openSession()->saveResponse(record.id, pipeline::WorkflowEngine::kUnexpectedMessage);
        return {503, errorBody("Service is shutting down")};
    }
    LOG_INFO("Accepted query " + std::to_string(record.id) + " from user " + std::to_string(*userId));

    return {202, json{
        {"status", "accepted"},
        {"query_id", record.id},
        {"user_id", record.userId},
        {"created_at", record.createdAt}
    }};
}

RouteResult RequestHandler::handleChatbotResponse(const std::map<std::string, std::string>& params) {
    if (auto unavailable = notConfigured()) {
        return *unavailable;
    }

    auto it = params.find("user_id");
    if (it == params.end()) {
        return {400, errorBody("Missing user_id parameter")};
    }
    auto userId = parseId(it->second);
    if (!userId) {
        return {400, errorBody("user_id must be an integer")};
    }

    auto session = m_store->openSession();
    auto record = session->latestQueryForUser(*userId);
    if (!record) {
        return {404, errorBody("No query found for user " + std::to_string(*userId))};
    }

    json body = record->toJson();
    body["status"] = "ok";
    return {200, body};
}

RouteResult RequestHandler::handleLatestForecast(const std::map<std::string, std::string>& params) {
    if (auto unavailable = notConfigured()) {
        return *unavailable;
    }

    auto it = params.find("type");
    if (it == params.end()) {
        return {400, errorBody("Missing type parameter (daily|monthly)")};
    }

    forecast::Mode mode;
    try {
        mode = forecast::modeFromString(it->second);
    } catch (const ValidationError& e) {
        return {400, errorBody(e.what())};
    }
    if (mode == forecast::Mode::Unrelated) {
        return {400, errorBody("type must be daily or monthly")};
    }

    auto session = m_store->openSession();
    auto record = session->latestForecast(mode);
    if (!record) {
        return {404, errorBody("No " + forecast::modeToString(mode) + " forecast stored yet")};
    }

    json body = record->toJson();
    body["status"] = "ok";
    return {200, body};
}

RouteResult RequestHandler::handleUpdateChart(forecast::Mode mode) {
    if (auto unavailable = notConfigured()) {
        return *unavailable;
    }

    m_dispatcher->dispatchScheduled(mode);
    return {202, json{
        {"status", "accepted"},
        {"forecast_type", forecast::modeToString(mode)}
    }};
}

} // namespace server
} // namespace rainsight
