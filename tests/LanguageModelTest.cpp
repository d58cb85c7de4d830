#include <catch2/catch_test_macros.hpp>
#include "llm/LanguageModel.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

using namespace rainsight;
using namespace rainsight::llm;
using namespace rainsight::testing;
using json = nlohmann::json;

namespace {

OpenAiOptions keyedOptions() {
    OpenAiOptions options;
    options.apiKey = "sk-test";
    options.endpoint = "http://llm.local";
    options.model = "gpt-test";
    return options;
}

std::string chatReply(const std::string& content) {
    return json{{"choices", json::array({json{{"message", {{"role", "assistant"}, {"content", content}}}}})}}.dump();
}

}

TEST_CASE("Model without key is unavailable", "[LanguageModel]") {
    auto transport = std::make_shared<FakeTransport>();
    OpenAiChatModel model(OpenAiOptions{}, transport);

    CHECK_FALSE(model.available());
    CHECK_THROWS_AS(model.complete(CompletionRequest{}), CapabilityError);
    CHECK(transport->callCount() == 0);
}

TEST_CASE("Completion posts a chat request", "[LanguageModel]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond(200, chatReply("Light showers expected."));
    OpenAiChatModel model(keyedOptions(), transport);

    CompletionRequest request;
    request.system = "system prompt";
    request.user = "will it rain?";
    request.temperature = 0.6;
    request.maxTokens = 400;

    REQUIRE(model.available());
    CHECK(model.complete(request) == "Light showers expected.");

    auto requests = transport->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "POST");
    CHECK(requests[0].url == "http://llm.local/v1/chat/completions");
    CHECK(requests[0].headers.at("Authorization") == "Bearer sk-test");

    auto body = json::parse(requests[0].body);
    CHECK(body["model"] == "gpt-test");
    CHECK(body["max_tokens"] == 400);
    REQUIRE(body["messages"].size() == 2);
    CHECK(body["messages"][0]["role"] == "system");
    CHECK(body["messages"][1]["content"] == "will it rain?");
}

TEST_CASE("Rejected or malformed completions raise CapabilityError", "[LanguageModel]") {
    auto transport = std::make_shared<FakeTransport>();
    OpenAiChatModel model(keyedOptions(), transport);

    SECTION("HTTP error") {
        transport->respond(401, R"({"error":"invalid key"})");
        CHECK_THROWS_AS(model.complete(CompletionRequest{}), CapabilityError);
    }

    SECTION("missing choices") {
        transport->respond(200, R"({"object":"chat.completion"})");
        CHECK_THROWS_AS(model.complete(CompletionRequest{}), CapabilityError);
    }

    SECTION("not JSON") {
        transport->respond(200, "upstream timeout");
        CHECK_THROWS_AS(model.complete(CompletionRequest{}), CapabilityError);
    }
}

TEST_CASE("Network failures propagate as TransportError", "[LanguageModel]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail();
    OpenAiChatModel model(keyedOptions(), transport);

    CHECK_THROWS_AS(model.complete(CompletionRequest{}), TransportError);
}
