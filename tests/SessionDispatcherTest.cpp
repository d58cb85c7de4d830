#include <catch2/catch_test_macros.hpp>
#include "pipeline/SessionDispatcher.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"
#include <thread>
#include <vector>

using namespace rainsight;
using namespace rainsight::pipeline;
using namespace rainsight::testing;

TEST_CASE("Dispatcher requires an engine", "[SessionDispatcher]") {
    REQUIRE_THROWS_AS(SessionDispatcher(nullptr, 2), ValidationError);
}

TEST_CASE("Interactive session runs on the pool", "[SessionDispatcher]") {
    EngineFixture fx;
    SessionDispatcher dispatcher(fx.sharedEngine(), 1);

    int64_t id = fx.submit("Will it rain tomorrow?");
    dispatcher.dispatchInteractive(id);
    dispatcher.wait();

    REQUIRE(dispatcher.pendingCount() == 0);
    REQUIRE(dispatcher.outcome(id) == TerminalStatus::Completed);

    auto record = fx.record(id);
    REQUIRE(record.completed);
    REQUIRE(record.responseText.has_value());
}

TEST_CASE("Unknown session is recorded as failed", "[SessionDispatcher]") {
    EngineFixture fx;
    SessionDispatcher dispatcher(fx.sharedEngine(), 1);

    dispatcher.dispatchInteractive(4242);
    dispatcher.wait();

    REQUIRE(dispatcher.outcome(4242) == TerminalStatus::Failed);
    REQUIRE_FALSE(dispatcher.outcome(1).has_value());
}

TEST_CASE("Scheduled refresh stores a chart", "[SessionDispatcher]") {
    EngineFixture fx;
    SessionDispatcher dispatcher(fx.sharedEngine(), 1);

    dispatcher.dispatchScheduled(forecast::Mode::Daily);
    dispatcher.wait();

    auto stored = fx.store->openSession()->latestForecast(forecast::Mode::Daily);
    REQUIRE(stored.has_value());
    REQUIRE(stored->payload.size() == 7);
}

TEST_CASE("Dispatcher refuses work after wait", "[SessionDispatcher]") {
    EngineFixture fx;
    SessionDispatcher dispatcher(fx.sharedEngine(), 1);
    REQUIRE(dispatcher.accepting());
    dispatcher.wait();
    dispatcher.wait();

    REQUIRE_FALSE(dispatcher.accepting());
    REQUIRE_THROWS_AS(dispatcher.dispatchInteractive(1), ValidationError);
    REQUIRE_THROWS_AS(dispatcher.dispatchScheduled(forecast::Mode::Monthly), ValidationError);
}

TEST_CASE("Work accepted while shutting down still runs", "[SessionDispatcher]") {
    EngineFixture fx;
    SessionDispatcher dispatcher(fx.sharedEngine(), 2, 1000);

    // Unknown ids fail fast, each accepted one must still get an outcome
    std::vector<int64_t> accepted;
    std::thread producer([&]() {
        for (int64_t id = 5000; id < 5200; ++id) {
            try {
                dispatcher.dispatchInteractive(id);
                accepted.push_back(id);
            } catch (const ValidationError&) {
                break;
            }
        }
    });

    dispatcher.wait();
    producer.join();

    REQUIRE(dispatcher.pendingCount() == 0);
    for (int64_t id : accepted) {
        REQUIRE(dispatcher.outcome(id) == TerminalStatus::Failed);
    }
}

TEST_CASE("Outcome history keeps the most recent sessions", "[SessionDispatcher]") {
    EngineFixture fx;
    SessionDispatcher dispatcher(fx.sharedEngine(), 1, 1);

    int64_t first = fx.submit("Will it rain tomorrow?");
    int64_t second = fx.submit("Rain next month?", 8);
    dispatcher.dispatchInteractive(first);
    dispatcher.dispatchInteractive(second);
    dispatcher.wait();

    REQUIRE_FALSE(dispatcher.outcome(first).has_value());
    REQUIRE(dispatcher.outcome(second).has_value());
}
