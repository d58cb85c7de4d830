#include "llm/LanguageModel.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <nlohmann/json.hpp>

namespace rainsight {
namespace llm {

using json = nlohmann::json;

OpenAiChatModel::OpenAiChatModel(OpenAiOptions options, std::shared_ptr<net::IHttpTransport> transport)
    : m_options(std::move(options))
    , m_transport(std::move(transport))
{
    while (!m_options.endpoint.empty() && m_options.endpoint.back() == '/') {
        m_options.endpoint.pop_back();
    }
}

std::string OpenAiChatModel::complete(const CompletionRequest& request) {
    if (!available()) {
        throw CapabilityError("Language model not configured (missing API key)");
    }

    json body = {
        {"model", m_options.model},
        {"temperature", request.temperature},
        {"max_tokens", request.maxTokens},
        {"messages", json::array({
            {{"role", "system"}, {"content", request.system}},
            {{"role", "user"}, {"content", request.user}}
        })}
    };

    net::HttpRequest http;
    http.method = "POST";
    http.url = m_options.endpoint + "/v1/chat/completions";
    http.headers["Content-Type"] = "application/json";
    http.headers["Authorization"] = "Bearer " + m_options.apiKey;
    http.body = body.dump();
    http.timeout = m_options.timeout;

    net::HttpResponse response = m_transport->send(http);
    if (!response.ok()) {
        throw CapabilityError("Chat completion rejected with HTTP " + std::to_string(response.status));
    }

    try {
        json reply = json::parse(response.body);
        std::string content = reply.at("choices").at(0).at("message").at("content").get<std::string>();
        LOG_DEBUG("Language model reply: " + content);
        return content;
    } catch (const json::exception& e) {
        throw CapabilityError(std::string("Malformed chat completion: ") + e.what());
    }
}

} // namespace llm
} // namespace rainsight
