#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "llm/IntentClassifier.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

using namespace rainsight;
using namespace rainsight::forecast;
using namespace rainsight::llm;
using namespace rainsight::testing;
using Catch::Matchers::WithinAbs;

TEST_CASE("Model reply decides the intent", "[IntentClassifier]") {
    auto model = std::make_shared<ScriptedModel>();
    model->reply(R"({"mode": "daily", "horizon": 5, "confidence": 0.92, "explanation": "next 5 days"})");
    IntentClassifier classifier(model);

    auto intent = classifier.classify("Will it rain in the next 5 days?");

    CHECK(intent.mode == Mode::Daily);
    CHECK(intent.horizon == 5);
    CHECK_THAT(intent.confidence, WithinAbs(0.92, 1e-12));
    CHECK(intent.explanation == "next 5 days");
    CHECK_THAT(intent.latitude, WithinAbs(6.585, 1e-12));
    CHECK_THAT(intent.longitude, WithinAbs(3.983, 1e-12));

    REQUIRE(model->requests().size() == 1);
    CHECK(model->requests()[0].user == "User Query: Will it rain in the next 5 days?");
}

TEST_CASE("Fenced replies are accepted", "[IntentClassifier]") {
    auto model = std::make_shared<ScriptedModel>();
    model->reply("```json\n{\"mode\": \"MONTHLY\", \"horizon\": 2, \"confidence\": 0.8}\n```");
    IntentClassifier classifier(model);

    auto intent = classifier.classify("rain outlook for the next two months");
    CHECK(intent.mode == Mode::Monthly);
    CHECK(intent.horizon == 2);
}

TEST_CASE("Unrelated queries have no horizon", "[IntentClassifier]") {
    auto model = std::make_shared<ScriptedModel>();
    model->reply(R"({"mode": "unrelated", "horizon": 4, "confidence": 0.99, "explanation": "football"})");
    IntentClassifier classifier(model);

    auto intent = classifier.classify("Who won the match yesterday?");
    CHECK(intent.mode == Mode::Unrelated);
    CHECK(intent.horizon == 0);
}

TEST_CASE("Horizons and confidence are clamped", "[IntentClassifier]") {
    ClassifierOptions options;
    options.maxDailyHorizon = 10;
    options.maxMonthlyHorizon = 6;
    IntentClassifier classifier(nullptr, options);

    auto daily = classifier.parseReply(R"({"mode": "daily", "horizon": 45, "confidence": 1.7})");
    CHECK(daily.horizon == 10);
    CHECK(daily.confidence == 1.0);

    auto monthly = classifier.parseReply(R"({"mode": "monthly", "horizon": 0, "confidence": -0.2})");
    CHECK(monthly.horizon == 1);
    CHECK(monthly.confidence == 0.0);

    auto defaulted = classifier.parseReply(R"({"mode": "monthly"})");
    CHECK(defaulted.horizon == IntentClassifier::kDefaultMonthlyHorizon);
    CHECK_THAT(defaulted.confidence, WithinAbs(0.5, 1e-12));
}

TEST_CASE("Unusable replies raise CapabilityError", "[IntentClassifier]") {
    IntentClassifier classifier(nullptr);
    CHECK_THROWS_AS(classifier.parseReply("I think it is daily"), CapabilityError);
    CHECK_THROWS_AS(classifier.parseReply(R"({"mode": "weekly"})"), CapabilityError);
    CHECK_THROWS_AS(classifier.parseReply(R"({"horizon": 3})"), CapabilityError);
    CHECK_THROWS_AS(classifier.parseReply(R"({"mode": "daily", "horizon": "soon"})"), CapabilityError);
    CHECK_THROWS_AS(classifier.parseReply("{mode: daily}"), CapabilityError);
}

TEST_CASE("Keyword rule applies when the model is unavailable", "[IntentClassifier]") {
    auto model = std::make_shared<ScriptedModel>(false);
    IntentClassifier classifier(model);

    auto monthly = classifier.classify("What is the rainfall for next MONTH?");
    CHECK(monthly.mode == Mode::Monthly);
    CHECK(monthly.horizon == IntentClassifier::kDefaultMonthlyHorizon);
    CHECK(monthly.confidence == IntentClassifier::kFallbackConfidence);

    auto daily = classifier.classify("Rain tomorrow?");
    CHECK(daily.mode == Mode::Daily);
    CHECK(daily.horizon == IntentClassifier::kDefaultDailyHorizon);

    CHECK(model->requests().empty());
}

TEST_CASE("Keyword rule applies when the model fails", "[IntentClassifier]") {
    auto model = std::make_shared<ScriptedModel>();

    SECTION("model error") {
        model->failNext();
        IntentClassifier classifier(model);
        auto intent = classifier.classify("monthly rain please");
        CHECK(intent.mode == Mode::Monthly);
        CHECK(intent.confidence == IntentClassifier::kFallbackConfidence);
    }

    SECTION("garbage reply") {
        model->reply("Sure! It looks like a daily question.");
        IntentClassifier classifier(model);
        auto intent = classifier.classify("rain this week?");
        CHECK(intent.mode == Mode::Daily);
        CHECK(intent.confidence == IntentClassifier::kFallbackConfidence);
    }

    SECTION("no model") {
        IntentClassifier classifier(nullptr);
        CHECK(classifier.classify("rain this week?").mode == Mode::Daily);
    }
}

TEST_CASE("Blank queries are rejected", "[IntentClassifier]") {
    IntentClassifier classifier(std::make_shared<ScriptedModel>());
    CHECK_THROWS_AS(classifier.classify(""), ValidationError);
    CHECK_THROWS_AS(classifier.classify("  \n\t"), ValidationError);
}
