#include <catch2/catch_test_macros.hpp>
#include "server/HttpServer.hpp"
#include "server/RequestHandler.hpp"
#include "net/HttpClient.hpp"
#include "core/Errors.hpp"
#include <nlohmann/json.hpp>
#include <thread>

using rainsight::server::HttpServer;
using rainsight::server::RequestHandler;

TEST_CASE("Server rejects a bad listen address", "[HttpServer]") {
    REQUIRE_THROWS_AS(HttpServer("not-an-address", 0), rainsight::ValidationError);
}

TEST_CASE("Server answers over a real socket", "[HttpServer]") {
    RequestHandler::instance().configure(nullptr, nullptr);

    HttpServer server("127.0.0.1", 0, 2);
    REQUIRE(server.port() != 0);
    std::thread loop([&server] { server.run(); });

    rainsight::net::BeastHttpTransport transport;
    std::string base = "http://127.0.0.1:" + std::to_string(server.port());

    rainsight::net::HttpRequest health;
    health.url = base + "/api/health";
    auto response = transport.send(health);

    rainsight::net::HttpRequest submit;
    submit.method = "POST";
    submit.url = base + "/api/user_input";
    submit.headers["Content-Type"] = "application/json";
    submit.body = R"({"user_id": 1, "message": "rain?"})";
    auto unavailable = transport.send(submit);

    server.stop();
    loop.join();

    REQUIRE(response.status == 200);
    REQUIRE(nlohmann::json::parse(response.body)["status"] == "ok");
    REQUIRE(unavailable.status == 503);
    REQUIRE(server.acceptedConnections() >= 1);
}

TEST_CASE("Second server on the same port fails", "[HttpServer]") {
    HttpServer first("127.0.0.1", 0);
    // reuse_address does not allow two listeners on one port
    REQUIRE_THROWS_AS(HttpServer("127.0.0.1", first.port()), rainsight::TransportError);
}
