#pragma once

#include "net/HttpClient.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace rainsight {
namespace llm {

struct CompletionRequest {
    std::string system;
    std::string user;
    double temperature = 0.0;
    int maxTokens = 256;
};

/**
 * Text completion capability
 *
 * complete() throws CapabilityError (unavailable, rejected, malformed reply)
 * or TransportError (network failure, timeout).
 */
class ILanguageModel {
public:
    virtual ~ILanguageModel() = default;
    virtual bool available() const = 0;
    virtual std::string complete(const CompletionRequest& request) = 0;
};

struct OpenAiOptions {
    std::string apiKey;
    std::string endpoint = "https://api.openai.com";
    std::string model = "gpt-4o-mini";
    std::chrono::milliseconds timeout{15000};
};

/**
 * OpenAI-compatible chat completions client
 * POST <endpoint>/v1/chat/completions with a bearer key
 */
class OpenAiChatModel : public ILanguageModel {
public:
    OpenAiChatModel(OpenAiOptions options, std::shared_ptr<net::IHttpTransport> transport);

    bool available() const override { return !m_options.apiKey.empty() && m_transport != nullptr; }
    std::string complete(const CompletionRequest& request) override;

private:
    OpenAiOptions m_options;
    std::shared_ptr<net::IHttpTransport> m_transport;
};

} // namespace llm
} // namespace rainsight
