#include <catch2/catch_test_macros.hpp>
#include "publish/Publisher.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

using namespace rainsight;
using namespace rainsight::forecast;
using namespace rainsight::publish;
using namespace rainsight::testing;

namespace {

PublisherOptions fastOptions() {
    PublisherOptions options;
    options.baseUrl = "http://charts.local/";
    options.maxAttempts = 3;
    options.retryDelay = std::chrono::milliseconds(0);
    return options;
}

BucketedForecast dailyBucket(size_t entries = 7) {
    BucketedForecast bucket;
    bucket.mode = Mode::Daily;
    for (size_t i = 0; i < entries; ++i) {
        bucket.entries.push_back(BucketEntry{addDays(CivilDate{2024, 6, 2}, static_cast<int>(i)), 1.25});
    }
    return bucket;
}

}

TEST_CASE("Sinks are derived from the base URL", "[Publisher]") {
    auto transport = std::make_shared<FakeTransport>();
    Publisher publisher(fastOptions(), transport);

    CHECK(publisher.sinkFor(Mode::Daily).url == "http://charts.local/daily_forecast");
    CHECK(publisher.sinkFor(Mode::Monthly).url == "http://charts.local/monthly_forecast");
    CHECK_THROWS_AS(publisher.sinkFor(Mode::Unrelated), ValidationError);
}

TEST_CASE("A bucket is posted as JSON", "[Publisher]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond(200);
    Publisher publisher(fastOptions(), transport);

    auto outcome = publisher.publish(dailyBucket());

    CHECK(outcome.success);
    CHECK(outcome.attempts == 1);
    CHECK(outcome.statusCode == 200);

    auto requests = transport->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "POST");
    CHECK(requests[0].url == "http://charts.local/daily_forecast");
    CHECK(requests[0].headers.at("Content-Type") == "application/json");

    auto body = nlohmann::json::parse(requests[0].body);
    REQUIRE(body.size() == 7);
    CHECK(body[0]["date"] == "2024-06-02");
    CHECK(body[0]["rainfall"] == 1.25);
}

TEST_CASE("Transport failures are retried with the same payload", "[Publisher]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail();
    Publisher publisher(fastOptions(), transport);

    auto outcome = publisher.publish(dailyBucket());

    CHECK_FALSE(outcome.success);
    CHECK(outcome.attempts == 3);
    CHECK(outcome.statusCode == 0);
    CHECK(outcome.message == "connection refused");

    auto requests = transport->requests();
    REQUIRE(requests.size() == 3);
    CHECK(requests[0].body == requests[2].body);
}

TEST_CASE("A retry can succeed", "[Publisher]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail();
    transport->respond(201);
    Publisher publisher(fastOptions(), transport);

    auto outcome = publisher.publish(dailyBucket());
    CHECK(outcome.success);
    CHECK(outcome.attempts == 2);
    CHECK(outcome.statusCode == 201);
}

TEST_CASE("Rejected buckets are not retried", "[Publisher]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond(422, R"({"error":"bad payload"})");
    Publisher publisher(fastOptions(), transport);

    auto outcome = publisher.publish(dailyBucket());
    CHECK_FALSE(outcome.success);
    CHECK(outcome.attempts == 1);
    CHECK(outcome.statusCode == 422);
    CHECK(transport->callCount() == 1);
}

TEST_CASE("A sink URL without scheme fails without retry", "[Publisher]") {
    auto options = fastOptions();
    options.baseUrl = "charts.example.com";
    Publisher publisher(options, std::make_shared<net::BeastHttpTransport>());

    PublishOutcome outcome;
    REQUIRE_NOTHROW(outcome = publisher.publish(dailyBucket()));
    CHECK_FALSE(outcome.success);
    CHECK(outcome.attempts == 1);
    CHECK(outcome.statusCode == 0);
    CHECK(outcome.message.find("URL without scheme") != std::string::npos);
}

TEST_CASE("Buckets of the wrong size are never sent", "[Publisher]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond(200);
    Publisher publisher(fastOptions(), transport);

    auto outcome = publisher.publish(dailyBucket(5));
    CHECK_FALSE(outcome.success);
    CHECK(outcome.attempts == 0);

    BucketedForecast unrelated;
    unrelated.mode = Mode::Unrelated;
    CHECK_FALSE(publisher.publish(unrelated).success);

    CHECK(transport->callCount() == 0);
}

TEST_CASE("At least one attempt is made", "[Publisher]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail();

    auto options = fastOptions();
    options.maxAttempts = 0;
    Publisher publisher(options, transport);

    auto outcome = publisher.publish(dailyBucket());
    CHECK(outcome.attempts == 1);
    CHECK(transport->callCount() == 1);
}

TEST_CASE("Outcome serializes", "[Publisher]") {
    PublishOutcome outcome;
    outcome.success = true;
    outcome.attempts = 2;
    outcome.statusCode = 200;
    outcome.message = "Published";

    auto j = outcome.toJson();
    CHECK(j["success"] == true);
    CHECK(j["attempts"] == 2);
    CHECK(j["status_code"] == 200);
}
