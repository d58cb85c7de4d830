#pragma once

#include "pipeline/SessionDispatcher.hpp"
#include "storage/RecordStore.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace rainsight {
namespace server {

using json = nlohmann::json;

/// Route handler result: {HTTP status code, JSON body}
using RouteResult = std::pair<unsigned, json>;

/**
 * Gestionnaire de requêtes - traite la logique métier
 *
 * Handlers return the HTTP status with the body so HttpSession only routes.
 */
class RequestHandler {
public:
    static RequestHandler& instance();

    /**
     * Inject the store and the dispatcher built at startup
     */
    void configure(std::shared_ptr<storage::IRecordStore> store,
                   std::shared_ptr<pipeline::SessionDispatcher> dispatcher);
    bool isConfigured() const { return m_store != nullptr && m_dispatcher != nullptr; }

    // Status
    RouteResult handleHealth();

    // Questions
    RouteResult handleUserInput(const json& request);
    RouteResult handleChatbotResponse(const std::map<std::string, std::string>& params);

    // Charts
    RouteResult handleLatestForecast(const std::map<std::string, std::string>& params);
    RouteResult handleUpdateChart(forecast::Mode mode);

private:
    RequestHandler() = default;
    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    std::optional<RouteResult> notConfigured() const;

    std::shared_ptr<storage::IRecordStore> m_store;
    std::shared_ptr<pipeline::SessionDispatcher> m_dispatcher;
};

} // namespace server
} // namespace rainsight
