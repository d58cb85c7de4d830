#include <catch2/catch_test_macros.hpp>
#include "llm/Summarizer.hpp"
#include "TestSupport.hpp"

using namespace rainsight;
using namespace rainsight::forecast;
using namespace rainsight::llm;
using namespace rainsight::testing;

namespace {

Intent dailyIntent() {
    Intent intent;
    intent.mode = Mode::Daily;
    intent.horizon = 7;
    intent.latitude = 6.585;
    intent.longitude = 3.983;
    return intent;
}

BucketedForecast dailyBucket(std::vector<double> values) {
    BucketedForecast bucket;
    bucket.mode = Mode::Daily;
    for (size_t i = 0; i < values.size(); ++i) {
        bucket.entries.push_back(BucketEntry{addDays(CivilDate{2024, 6, 2}, static_cast<int>(i)), values[i]});
    }
    return bucket;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

}

TEST_CASE("Model interpretation is returned as is", "[Summarizer]") {
    auto model = std::make_shared<ScriptedModel>();
    model->reply("Expect a wet start to the week.");
    Summarizer summarizer(model);

    auto text = summarizer.summarize(dailyIntent(), dailyBucket({5.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0}));
    CHECK(text == "Expect a wet start to the week.");

    REQUIRE(model->requests().size() == 1);
    CHECK(contains(model->requests()[0].user, "\"2024-06-02\""));
    CHECK(contains(model->requests()[0].user, "daily rainfall forecast"));
}

TEST_CASE("Local summary replaces a failing model", "[Summarizer]") {
    auto model = std::make_shared<ScriptedModel>();
    model->failAlways();
    Summarizer summarizer(model);

    auto text = summarizer.summarize(dailyIntent(), dailyBucket({0.4, 3.0, 12.5, 0.0, 1.0, 0.0, 0.0}));

    CHECK(contains(text, "Daily rainfall outlook"));
    CHECK(contains(text, "- 2024-06-04: 12.50 mm"));
    CHECK(contains(text, "Total 16.90 mm over 7 days, 3 wet days."));
    CHECK(contains(text, "Heaviest: 2024-06-04 with 12.50 mm."));
}

TEST_CASE("Empty model reply falls back to the local summary", "[Summarizer]") {
    auto model = std::make_shared<ScriptedModel>();
    model->reply("");
    Summarizer summarizer(model);

    auto text = summarizer.summarize(dailyIntent(), dailyBucket({1.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0}));
    CHECK(contains(text, "Total 1.00 mm"));
}

TEST_CASE("Dry outlook says so", "[Summarizer]") {
    Summarizer summarizer(nullptr);
    auto text = summarizer.summarize(dailyIntent(), dailyBucket(std::vector<double>(7, 0.0)));

    CHECK(contains(text, "0 wet days."));
    CHECK(contains(text, "No rainfall expected."));
    CHECK_FALSE(contains(text, "Heaviest"));
}

TEST_CASE("Monthly summary labels months", "[Summarizer]") {
    Intent intent = dailyIntent();
    intent.mode = Mode::Monthly;

    BucketedForecast bucket;
    bucket.mode = Mode::Monthly;
    bucket.entries.push_back(BucketEntry{CivilDate{2024, 11, 1}, 95.0});
    bucket.entries.push_back(BucketEntry{CivilDate{2024, 12, 1}, 20.0});
    bucket.entries.push_back(BucketEntry{CivilDate{2025, 1, 1}, 4.5});

    auto text = Summarizer::localSummary(intent, bucket);
    CHECK(contains(text, "Monthly rainfall outlook"));
    CHECK(contains(text, "- 2024-11: 95.00 mm"));
    CHECK(contains(text, "over 3 months, 3 wet months."));
    CHECK(contains(text, "Heaviest: 2024-11"));
}
