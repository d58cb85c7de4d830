#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "forecast/ResultBucketer.hpp"
#include "core/Errors.hpp"

using namespace rainsight;
using namespace rainsight::forecast;
using Catch::Matchers::WithinAbs;

namespace {

ForecastSequence sequenceOf(Mode mode, std::vector<double> values) {
    ForecastSequence sequence;
    sequence.mode = mode;
    for (size_t i = 0; i < values.size(); ++i) {
        sequence.steps.push_back(ForecastStep{static_cast<int>(i + 1), values[i], false});
    }
    return sequence;
}

}

TEST_CASE("Short daily forecasts are padded to a full week", "[ResultBucketer]") {
    ResultBucketer bucketer;
    // Wednesday
    auto bucket = bucketer.bucket(sequenceOf(Mode::Daily, {1.0, 2.0, 3.0}), Mode::Daily, CivilDate{2024, 6, 5});

    REQUIRE(bucket.size() == 7);
    CHECK(bucket.mode == Mode::Daily);
    CHECK(bucket.entries[0].date == CivilDate{2024, 6, 2});
    CHECK(weekday(bucket.entries[0].date) == 0);
    for (size_t i = 1; i < bucket.entries.size(); ++i) {
        CHECK(bucket.entries[i].date == addDays(bucket.entries[i - 1].date, 1));
    }
    CHECK(bucket.entries[2].rainfallMm == 3.0);
    for (size_t i = 3; i < 7; ++i) {
        CHECK(bucket.entries[i].rainfallMm == 0.0);
    }
}

TEST_CASE("Extra daily steps are dropped", "[ResultBucketer]") {
    ResultBucketer bucketer;
    auto bucket = bucketer.bucket(sequenceOf(Mode::Daily, std::vector<double>(10, 4.0)),
                                  Mode::Daily, CivilDate{2024, 6, 8});
    REQUIRE(bucket.size() == 7);
    CHECK(bucket.entries.back().date == CivilDate{2024, 6, 8});
}

TEST_CASE("Monthly buckets roll over the year", "[ResultBucketer]") {
    ResultBucketer bucketer;
    auto bucket = bucketer.bucket(sequenceOf(Mode::Monthly, {80.0, 20.5}), Mode::Monthly, CivilDate{2024, 11, 17});

    REQUIRE(bucket.size() == 3);
    CHECK(bucket.entries[0].date == CivilDate{2024, 11, 1});
    CHECK(bucket.entries[1].date == CivilDate{2024, 12, 1});
    CHECK(bucket.entries[2].date == CivilDate{2025, 1, 1});
    CHECK(bucket.entries[1].rainfallMm == 20.5);
    CHECK(bucket.entries[2].rainfallMm == 0.0);
}

TEST_CASE("Week anchor selects the starting Sunday", "[ResultBucketer]") {
    ResultBucketer current(WeekAnchor::Current);
    ResultBucketer next(WeekAnchor::Next);

    CHECK(current.weekStart(CivilDate{2024, 6, 5}) == CivilDate{2024, 6, 2});
    CHECK(next.weekStart(CivilDate{2024, 6, 5}) == CivilDate{2024, 6, 9});

    // Today is Sunday
    CHECK(current.weekStart(CivilDate{2024, 6, 2}) == CivilDate{2024, 6, 2});
    CHECK(next.weekStart(CivilDate{2024, 6, 2}) == CivilDate{2024, 6, 9});

    // Across a month boundary
    CHECK(current.weekStart(CivilDate{2024, 3, 1}) == CivilDate{2024, 2, 25});
}

TEST_CASE("Unrelated forecasts cannot be bucketed", "[ResultBucketer]") {
    ResultBucketer bucketer;
    CHECK_THROWS_AS(bucketer.bucket(sequenceOf(Mode::Daily, {1.0}), Mode::Unrelated, CivilDate{2024, 1, 1}),
                    ValidationError);
}

TEST_CASE("Bucket payload rounds to two decimals", "[ResultBucketer]") {
    BucketedForecast bucket;
    bucket.mode = Mode::Monthly;
    bucket.entries.push_back(BucketEntry{CivilDate{2024, 11, 1}, 12.3456});
    bucket.entries.push_back(BucketEntry{CivilDate{2024, 12, 1}, 0.004});

    auto payload = bucket.toJson();
    REQUIRE(payload.is_array());
    REQUIRE(payload.size() == 2);
    CHECK(payload[0]["date"] == "2024-11-01");
    CHECK_THAT(payload[0]["rainfall"].get<double>(), WithinAbs(12.35, 1e-9));
    CHECK_THAT(payload[1]["rainfall"].get<double>(), WithinAbs(0.0, 1e-9));

    auto parsed = BucketedForecast::fromJson(Mode::Monthly, payload);
    REQUIRE(parsed.size() == 2);
    CHECK(parsed.entries[1].date == CivilDate{2024, 12, 1});

    CHECK_THROWS_AS(BucketedForecast::fromJson(Mode::Daily, nlohmann::json::object()), ValidationError);
}

TEST_CASE("Week anchors parse from text", "[ResultBucketer]") {
    CHECK(weekAnchorFromString("current") == WeekAnchor::Current);
    CHECK(weekAnchorFromString("next") == WeekAnchor::Next);
    CHECK(weekAnchorToString(WeekAnchor::Next) == "next");
    CHECK_THROWS_AS(weekAnchorFromString("previous"), ValidationError);
}
