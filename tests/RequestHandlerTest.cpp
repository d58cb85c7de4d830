#include <catch2/catch_test_macros.hpp>
#include "server/RequestHandler.hpp"
#include "server/HttpSession.hpp"
#include "TestSupport.hpp"

using namespace rainsight;
using namespace rainsight::testing;
using rainsight::server::RequestHandler;
using rainsight::server::RequestTarget;
using json = nlohmann::json;

namespace beast_http = rainsight::server::http;

namespace {

/**
 * Handler wired to a fixture, reset to unconfigured on scope exit
 */
struct ConfiguredHandler {
    EngineFixture fx;
    std::shared_ptr<pipeline::SessionDispatcher> dispatcher;

    ConfiguredHandler()
        : dispatcher(std::make_shared<pipeline::SessionDispatcher>(fx.sharedEngine(), 1))
    {
        RequestHandler::instance().configure(fx.store, dispatcher);
    }

    ~ConfiguredHandler() {
        dispatcher->wait();
        RequestHandler::instance().configure(nullptr, nullptr);
    }

    RequestHandler& handler() { return RequestHandler::instance(); }
};

beast_http::request<beast_http::string_body> makeRequest(beast_http::verb method,
                                                         const std::string& target,
                                                         const std::string& body = "") {
    beast_http::request<beast_http::string_body> req{method, target, 11};
    req.body() = body;
    req.prepare_payload();
    return req;
}

} // anonymous namespace

// =============================================================================
// Request target parsing
// =============================================================================

TEST_CASE("Request target splits path and parameters", "[RequestHandler]") {
    auto target = RequestTarget::parse("/api/chatbot_response?user_id=42&lang=en");
    REQUIRE(target.path == "/api/chatbot_response");
    REQUIRE(target.params.size() == 2);
    REQUIRE(target.params.at("user_id") == "42");
    REQUIRE(target.params.at("lang") == "en");
}

TEST_CASE("Request target decodes parameters", "[RequestHandler]") {
    auto target = RequestTarget::parse("/x?q=heavy%20rain+today&flag&&empty=");
    REQUIRE(target.path == "/x");
    REQUIRE(target.params.at("q") == "heavy rain today");
    REQUIRE(target.params.count("flag") == 1);
    REQUIRE(target.params.at("empty").empty());
}

TEST_CASE("Request target without query", "[RequestHandler]") {
    auto target = RequestTarget::parse("/api/health");
    REQUIRE(target.path == "/api/health");
    REQUIRE(target.params.empty());
}

// =============================================================================
// Unconfigured handler
// =============================================================================

TEST_CASE("Unconfigured handler answers 503", "[RequestHandler]") {
    auto& handler = RequestHandler::instance();
    handler.configure(nullptr, nullptr);
    REQUIRE_FALSE(handler.isConfigured());

    REQUIRE(handler.handleUserInput(json{{"user_id", 1}, {"message", "rain?"}}).first == 503);
    REQUIRE(handler.handleChatbotResponse({{"user_id", "1"}}).first == 503);
    REQUIRE(handler.handleLatestForecast({{"type", "daily"}}).first == 503);
    REQUIRE(handler.handleUpdateChart(forecast::Mode::Daily).first == 503);

    auto health = handler.handleHealth();
    REQUIRE(health.first == 200);
    REQUIRE(health.second["status"] == "ok");
    REQUIRE(health.second["store"] == "none");
}

// =============================================================================
// Questions
// =============================================================================

TEST_CASE("User input is validated", "[RequestHandler]") {
    ConfiguredHandler ctx;
    auto& handler = ctx.handler();

    SECTION("Not an object") {
        REQUIRE(handler.handleUserInput(json::array()).first == 400);
    }
    SECTION("Missing message") {
        REQUIRE(handler.handleUserInput(json{{"user_id", 1}}).first == 400);
    }
    SECTION("Non numeric user id") {
        REQUIRE(handler.handleUserInput(json{{"user_id", "abc"}, {"message", "rain?"}}).first == 400);
        REQUIRE(handler.handleUserInput(json{{"user_id", 1.5}, {"message", "rain?"}}).first == 400);
    }
    SECTION("Blank message") {
        REQUIRE(handler.handleUserInput(json{{"user_id", 1}, {"message", "  \n"}}).first == 400);
    }
    SECTION("Message is not a string") {
        REQUIRE(handler.handleUserInput(json{{"user_id", 1}, {"message", 12}}).first == 400);
    }
}

TEST_CASE("Accepted question is answered in the background", "[RequestHandler]") {
    ConfiguredHandler ctx;
    auto& handler = ctx.handler();

    auto accepted = handler.handleUserInput(json{{"user_id", "12"}, {"message", "Will it rain tomorrow?"}});
    REQUIRE(accepted.first == 202);
    REQUIRE(accepted.second["status"] == "accepted");
    REQUIRE(accepted.second["user_id"] == 12);
    int64_t queryId = accepted.second["query_id"].get<int64_t>();

    ctx.dispatcher->wait();

    auto answer = handler.handleChatbotResponse({{"user_id", "12"}});
    REQUIRE(answer.first == 200);
    REQUIRE(answer.second["query_id"] == queryId);
    REQUIRE(answer.second["is_completed"] == true);
    REQUIRE(answer.second["response_text"].is_string());
}

TEST_CASE("Questions are refused once the dispatcher stopped", "[RequestHandler]") {
    ConfiguredHandler ctx;
    ctx.dispatcher->wait();

    auto refused = ctx.handler().handleUserInput(json{{"user_id", 12}, {"message", "Rain this week?"}});
    REQUIRE(refused.first == 503);
    REQUIRE(refused.second["status"] == "error");

    // No record is left waiting for an answer that never comes
    REQUIRE_FALSE(ctx.fx.store->openSession()->latestQueryForUser(12).has_value());
    REQUIRE(ctx.handler().handleChatbotResponse({{"user_id", "12"}}).first == 404);
}

TEST_CASE("Chatbot response parameters", "[RequestHandler]") {
    ConfiguredHandler ctx;
    auto& handler = ctx.handler();

    REQUIRE(handler.handleChatbotResponse({}).first == 400);
    REQUIRE(handler.handleChatbotResponse({{"user_id", "12x"}}).first == 400);
    REQUIRE(handler.handleChatbotResponse({{"user_id", "99"}}).first == 404);
}

// =============================================================================
// Charts
// =============================================================================

TEST_CASE("Latest forecast lookup", "[RequestHandler]") {
    ConfiguredHandler ctx;
    auto& handler = ctx.handler();

    REQUIRE(handler.handleLatestForecast({}).first == 400);
    REQUIRE(handler.handleLatestForecast({{"type", "hourly"}}).first == 400);
    REQUIRE(handler.handleLatestForecast({{"type", "unrelated"}}).first == 400);
    REQUIRE(handler.handleLatestForecast({{"type", "daily"}}).first == 404);

    forecast::BucketedForecast bucket;
    bucket.mode = forecast::Mode::Monthly;
    bucket.entries = {
        {CivilDate{2024, 6, 1}, 120.5},
        {CivilDate{2024, 7, 1}, 98.25},
        {CivilDate{2024, 8, 1}, 40.0}
    };
    ctx.fx.store->openSession()->saveForecast(bucket);

    auto found = handler.handleLatestForecast({{"type", "monthly"}});
    REQUIRE(found.first == 200);
    REQUIRE(found.second["status"] == "ok");
    REQUIRE(found.second["forecast_data"].size() == 3);
}

TEST_CASE("Chart refresh is queued", "[RequestHandler]") {
    ConfiguredHandler ctx;

    auto result = ctx.handler().handleUpdateChart(forecast::Mode::Daily);
    REQUIRE(result.first == 202);
    REQUIRE(result.second["forecast_type"] == "daily");

    ctx.dispatcher->wait();
    REQUIRE(ctx.fx.store->openSession()->latestForecast(forecast::Mode::Daily).has_value());
}

// =============================================================================
// Routing
// =============================================================================

TEST_CASE("Session routes requests", "[RequestHandler]") {
    using rainsight::server::HttpSession;
    ConfiguredHandler ctx;

    SECTION("Health") {
        auto res = HttpSession::handleRequest(makeRequest(beast_http::verb::get, "/api/health"));
        REQUIRE(res.result() == beast_http::status::ok);
        REQUIRE(json::parse(res.body())["store"] == "sqlite");
        REQUIRE(res[beast_http::field::content_type] == "application/json");
    }

    SECTION("Unknown path") {
        auto res = HttpSession::handleRequest(makeRequest(beast_http::verb::get, "/api/nothing"));
        REQUIRE(res.result() == beast_http::status::not_found);
    }

    SECTION("Wrong method") {
        auto res = HttpSession::handleRequest(makeRequest(beast_http::verb::get, "/api/user_input"));
        REQUIRE(res.result() == beast_http::status::not_found);
    }

    SECTION("Invalid JSON body") {
        auto res = HttpSession::handleRequest(makeRequest(beast_http::verb::post, "/api/user_input", "{oops"));
        REQUIRE(res.result() == beast_http::status::bad_request);
        REQUIRE(json::parse(res.body())["status"] == "error");
    }

    SECTION("Accepted question") {
        auto res = HttpSession::handleRequest(makeRequest(beast_http::verb::post, "/api/user_input",
            R"({"user_id": 3, "message": "Rain next month?"})"));
        REQUIRE(res.result() == beast_http::status::accepted);
    }

    SECTION("Query parameters reach the handler") {
        auto res = HttpSession::handleRequest(makeRequest(beast_http::verb::get,
            "/api/chatbot_response?user_id=31"));
        REQUIRE(res.result() == beast_http::status::not_found);
    }

    SECTION("CORS preflight") {
        auto res = HttpSession::handleRequest(makeRequest(beast_http::verb::options, "/api/user_input"));
        REQUIRE(res.result() == beast_http::status::no_content);
        REQUIRE(res[beast_http::field::access_control_allow_origin] == "*");
    }
}
