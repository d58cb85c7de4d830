#include <catch2/catch_test_macros.hpp>
#include "storage/SqliteRecordStore.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

using namespace rainsight;
using namespace rainsight::storage;
using namespace rainsight::testing;

namespace {

forecast::BucketedForecast bucketOf(forecast::Mode mode, double rainfall) {
    forecast::BucketedForecast bucket;
    bucket.mode = mode;
    for (size_t i = 0; i < forecast::bucketSize(mode); ++i) {
        CivilDate date = mode == forecast::Mode::Monthly
            ? addMonths(CivilDate{2024, 11, 1}, static_cast<int>(i))
            : addDays(CivilDate{2024, 6, 2}, static_cast<int>(i));
        bucket.entries.push_back(forecast::BucketEntry{date, rainfall});
    }
    return bucket;
}

}

// =============================================================================
// Queries
// =============================================================================

TEST_CASE("Created query is pending", "[SqliteRecordStore]") {
    TempDatabase db;
    SqliteRecordStore store(db.path());
    auto session = store.openSession();

    auto created = session->createQuery(42, "Will it rain this week?");
    CHECK(created.id > 0);
    CHECK(created.userId == 42);
    CHECK_FALSE(created.createdAt.empty());

    auto loaded = session->getQuery(created.id);
    REQUIRE(loaded);
    CHECK(loaded->queryText == "Will it rain this week?");
    CHECK(loaded->createdAt == created.createdAt);
    CHECK_FALSE(loaded->completed);
    CHECK_FALSE(loaded->responseText);
    CHECK_FALSE(loaded->responseTime);
}

TEST_CASE("Saving a response completes the query", "[SqliteRecordStore]") {
    TempDatabase db;
    SqliteRecordStore store(db.path());
    auto session = store.openSession();

    auto created = session->createQuery(1, "Rain tomorrow?");
    session->saveResponse(created.id, "Light showers expected.");

    auto loaded = session->getQuery(created.id);
    REQUIRE(loaded);
    CHECK(loaded->completed);
    CHECK(loaded->responseText == std::optional<std::string>("Light showers expected."));
    REQUIRE(loaded->responseTime);
    CHECK(loaded->responseTime->back() == 'Z');

    auto j = loaded->toJson();
    CHECK(j["query_id"] == created.id);
    CHECK(j["is_completed"] == true);
    CHECK(j["response_text"] == "Light showers expected.");
}

TEST_CASE("Responses for unknown queries are rejected", "[SqliteRecordStore]") {
    TempDatabase db;
    SqliteRecordStore store(db.path());
    auto session = store.openSession();

    CHECK_THROWS_AS(session->saveResponse(404, "nobody asked"), PersistenceError);
    CHECK_FALSE(session->getQuery(404));
}

TEST_CASE("Latest query is per user", "[SqliteRecordStore]") {
    TempDatabase db;
    SqliteRecordStore store(db.path());
    auto session = store.openSession();

    session->createQuery(1, "first");
    auto second = session->createQuery(1, "second");
    session->createQuery(2, "other user");

    auto latest = session->latestQueryForUser(1);
    REQUIRE(latest);
    CHECK(latest->id == second.id);
    CHECK(latest->queryText == "second");
    CHECK_FALSE(session->latestQueryForUser(3));

    auto pending = latest->toJson();
    CHECK(pending["response_text"].is_null());
}

TEST_CASE("Query text is stored verbatim", "[SqliteRecordStore]") {
    TempDatabase db;
    SqliteRecordStore store(db.path());
    auto session = store.openSession();

    std::string text = "It's \"raining\"; DROP TABLE user_queries; -- é";
    auto created = session->createQuery(5, text);
    CHECK(session->getQuery(created.id)->queryText == text);
}

// =============================================================================
// Forecasts
// =============================================================================

TEST_CASE("Latest forecast is per type", "[SqliteRecordStore]") {
    TempDatabase db;
    SqliteRecordStore store(db.path());
    auto session = store.openSession();

    CHECK_FALSE(session->latestForecast(forecast::Mode::Daily));

    auto first = session->saveForecast(bucketOf(forecast::Mode::Daily, 1.0));
    auto second = session->saveForecast(bucketOf(forecast::Mode::Daily, 2.5));
    session->saveForecast(bucketOf(forecast::Mode::Monthly, 80.0));

    CHECK(second.id > first.id);

    auto daily = session->latestForecast(forecast::Mode::Daily);
    REQUIRE(daily);
    CHECK(daily->id == second.id);
    CHECK(daily->mode == forecast::Mode::Daily);
    REQUIRE(daily->payload.size() == 7);
    CHECK(daily->payload[0]["date"] == "2024-06-02");
    CHECK(daily->payload[0]["rainfall"] == 2.5);

    auto monthly = session->latestForecast(forecast::Mode::Monthly);
    REQUIRE(monthly);
    CHECK(monthly->payload.size() == 3);
    CHECK(monthly->toJson()["forecast_type"] == "monthly");
}

// =============================================================================
// Sessions
// =============================================================================

TEST_CASE("Sessions see each other's writes", "[SqliteRecordStore]") {
    TempDatabase db;
    SqliteRecordStore store(db.path());

    auto writer = store.openSession();
    auto reader = store.openSession();

    auto created = writer->createQuery(9, "Rain?");
    writer->saveResponse(created.id, "No.");

    auto loaded = reader->getQuery(created.id);
    REQUIRE(loaded);
    CHECK(loaded->completed);
}

TEST_CASE("Schema survives reopening the store", "[SqliteRecordStore]") {
    TempDatabase db;
    int64_t id = 0;
    {
        SqliteRecordStore store(db.path());
        id = store.openSession()->createQuery(3, "persisted?").id;
    }

    SqliteRecordStore reopened(db.path());
    CHECK(reopened.backendName() == "sqlite");
    auto loaded = reopened.openSession()->getQuery(id);
    REQUIRE(loaded);
    CHECK(loaded->queryText == "persisted?");
}

TEST_CASE("Unopenable database raises PersistenceError", "[SqliteRecordStore]") {
    CHECK_THROWS_AS(SqliteRecordStore("/nonexistent/dir/rainsight.db"), PersistenceError);
}
