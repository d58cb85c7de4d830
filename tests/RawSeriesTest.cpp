#include <catch2/catch_test_macros.hpp>
#include "forecast/RawSeries.hpp"
#include "core/Errors.hpp"
#include <cmath>

using namespace rainsight;
using namespace rainsight::forecast;

TEST_CASE("Rows are stored by field", "[RawSeries]") {
    RawSeries series;
    series.addRow(CivilDate{2024, 1, 1}, {{"T2M", 26.0}, {"PRECTOTCORR", 0.4}});
    series.addRow(CivilDate{2024, 1, 2}, {{"T2M", 27.5}, {"PRECTOTCORR", 3.1}});

    REQUIRE(series.rowCount() == 2);
    CHECK_FALSE(series.empty());
    CHECK(series.hasField("T2M"));
    CHECK(series.value(1, "T2M") == 27.5);
    CHECK(series.column("PRECTOTCORR") == std::vector<double>{0.4, 3.1});
    CHECK(series.fieldNames() == std::vector<std::string>{"PRECTOTCORR", "T2M"});
}

TEST_CASE("Unreported values are NaN", "[RawSeries]") {
    RawSeries series;
    series.addRow(CivilDate{2024, 1, 1}, {{"T2M", 26.0}});
    series.addRow(CivilDate{2024, 1, 2}, {{"RH2M", 80.0}});

    CHECK(std::isnan(series.value(0, "RH2M")));
    CHECK(std::isnan(series.value(1, "T2M")));
    CHECK(series.column("RH2M").size() == 2);
}

TEST_CASE("Missing fields yield an empty column", "[RawSeries]") {
    RawSeries series;
    series.addRow(CivilDate{2024, 1, 1}, {{"T2M", 26.0}});

    CHECK_FALSE(series.hasField("PS"));
    CHECK(series.column("PS").empty());
    CHECK(std::isnan(series.value(0, "PS")));
    CHECK(std::isnan(series.value(5, "T2M")));
}

TEST_CASE("The sentinel is kept as reported", "[RawSeries]") {
    RawSeries series;
    series.addRow(CivilDate{2024, 1, 1}, {{"PRECTOTCORR", RawSeries::kMissingSentinel}});
    CHECK(series.value(0, "PRECTOTCORR") == -999.0);
}

TEST_CASE("Dates must strictly increase", "[RawSeries]") {
    RawSeries series;
    series.addRow(CivilDate{2024, 1, 2}, {{"T2M", 26.0}});

    CHECK_THROWS_AS(series.addRow(CivilDate{2024, 1, 2}, {{"T2M", 26.0}}), ValidationError);
    CHECK_THROWS_AS(series.addRow(CivilDate{2024, 1, 1}, {{"T2M", 26.0}}), ValidationError);
    CHECK(series.rowCount() == 1);
}
