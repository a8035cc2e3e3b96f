#include "path_simulator.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

using namespace retiresim;

namespace {

const EngineData& engineData() {
    static const EngineData data = EngineData::defaults();
    return data;
}

SimulationParams singleRetiree() {
    SimulationParams p;
    p.filingStatus = FilingStatus::Single;
    p.age1 = 60;
    p.retirementAge = 65;
    p.lifeExpectancy = 95;
    p.taxableBalance = 1000000.0;
    p.returnMode = ReturnMode::Fixed;
    p.returnPct = 6.0;
    p.inflationPct = 2.5;
    p.withdrawalPct = 4.0;
    return p;
}

}  // namespace

TEST_CASE("trajectory spans accumulation and drawdown", "[path]") {
    const PathSimulator sim(singleRetiree(), engineData());
    const PathResult result = sim.run(1);
    REQUIRE(result.trajectory.size() == 36);
    REQUIRE(result.trajectory.front().age == 60);
    REQUIRE(result.trajectory.back().age == 95);
    REQUIRE(result.trajectory.front().cumulativeInflation == Approx(1.0));
    REQUIRE(result.trajectory[1].cumulativeInflation == Approx(1.025));
}

TEST_CASE("sustainable withdrawal draws the real balance down without ruin", "[path]") {
    const PathSimulator sim(singleRetiree(), engineData());
    const PathResult result = sim.run(42);

    REQUIRE_FALSE(result.ruined);
    REQUIRE(result.survivalYears == 30);
    REQUIRE(result.eolReal > 0.0);
    REQUIRE(result.y1AfterTaxReal > 0.0);

    // Retirement is trajectory index 5.
    for (std::size_t t = 6; t < result.trajectory.size(); ++t) {
        REQUIRE(result.trajectory[t].real < result.trajectory[t - 1].real);
        REQUIRE(result.trajectory[t].grossWithdrawal > 0.0);
    }
    // Accumulation grows at 6% nominal with no contributions.
    REQUIRE(result.trajectory[5].nominal == Approx(1000000.0 * std::pow(1.06, 5)));
}

TEST_CASE("required distributions are reinvested when spending is zero", "[path][rmd]") {
    SimulationParams p;
    p.filingStatus = FilingStatus::Married;
    p.age1 = 72;
    p.age2 = 72;
    p.retirementAge = 73;
    p.lifeExpectancy = 95;
    p.pretaxBalance = 400000.0;
    p.returnMode = ReturnMode::Fixed;
    p.returnPct = 6.0;
    p.withdrawalPct = 0.0;

    const PathResult result = PathSimulator(p, engineData()).run(9);
    REQUIRE(result.trajectory.size() == 24);
    REQUIRE(result.trajectory[2].age == 74);

    for (std::size_t t = 2; t < result.trajectory.size(); ++t) {
        const YearlyState& state = result.trajectory[t];
        REQUIRE(state.requiredDistribution > 0.0);
        REQUIRE(state.accounts.taxable > result.trajectory[t - 1].accounts.taxable);
        REQUIRE(state.accounts.pretax < result.trajectory[t - 1].accounts.pretax * 1.06);
    }
    REQUIRE_FALSE(result.ruined);
}

TEST_CASE("higher withdrawal never leaves more money", "[path]") {
    double previous = std::numeric_limits<double>::infinity();
    for (double rate : {2.0, 4.0, 6.0, 9.0, 15.0}) {
        SimulationParams p = singleRetiree();
        p.withdrawalPct = rate;
        const PathResult result = PathSimulator(p, engineData()).run(5);
        REQUIRE(result.eolReal <= previous);
        previous = result.eolReal;
    }

    SimulationParams reckless = singleRetiree();
    reckless.withdrawalPct = 20.0;
    const PathResult ruined = PathSimulator(reckless, engineData()).run(5);
    REQUIRE(ruined.ruined);
    REQUIRE(ruined.survivalYears < 30);
    REQUIRE(ruined.eolReal == 0.0);
}

TEST_CASE("emergency fund carries spending after the portfolio is gone", "[path]") {
    SimulationParams p = singleRetiree();
    p.taxableBalance = 0.0;
    p.emergencyFund = 50000.0;
    p.returnPct = 0.0;
    p.inflationPct = 0.0;

    const PathResult result = PathSimulator(p, engineData()).run(3);
    REQUIRE(result.y1AfterTaxReal == Approx(2000.0));
    REQUIRE(result.ruined);
    REQUIRE(result.survivalYears == 25);
}

TEST_CASE("same seed reproduces a bootstrap path", "[path]") {
    SimulationParams p = singleRetiree();
    p.returnMode = ReturnMode::Bootstrap;
    const PathSimulator sim(p, engineData());
    const PathResult a = sim.run(1234);
    const PathResult b = sim.run(1234);
    REQUIRE(a.eolReal == b.eolReal);
    REQUIRE(a.ruined == b.ruined);
    REQUIRE(a.trajectory.size() == b.trajectory.size());
}

TEST_CASE("historical playback starting near the end of the series still runs", "[path]") {
    SimulationParams p = singleRetiree();
    p.returnMode = ReturnMode::Historical;
    p.historicalStartYear = 2020;
    REQUIRE_NOTHROW(PathSimulator(p, engineData()).run(1));
}

TEST_CASE("contributions stop at retirement", "[path]") {
    SimulationParams p = singleRetiree();
    p.taxableBalance = 0.0;
    p.returnPct = 0.0;
    p.inflationPct = 0.0;
    p.withdrawalPct = 0.0;
    p.contributions1.pretax = 10000.0;
    p.contributions1.employerMatch = 5000.0;
    p.contributions1.roth = 5000.0;

    const PathResult result = PathSimulator(p, engineData()).run(1);
    // Deposits at ages 60..64.
    REQUIRE(result.trajectory[5].accounts.pretax == Approx(75000.0));
    REQUIRE(result.trajectory[5].accounts.roth == Approx(25000.0));
}

TEST_CASE("Roth conversions move pre-tax money before RMD age", "[path][roth]") {
    SimulationParams p = singleRetiree();
    p.taxableBalance = 500000.0;
    p.pretaxBalance = 800000.0;
    p.rothConversion.enabled = true;

    const PathResult result = PathSimulator(p, engineData()).run(1);
    REQUIRE(result.totalRothConversions > 0.0);
    REQUIRE(result.conversionTaxesPaid > 0.0);
    REQUIRE(result.trajectory[6].accounts.roth > 0.0);
}

TEST_CASE("invalid ages are rejected", "[path]") {
    SimulationParams p = singleRetiree();
    p.retirementAge = 60;
    REQUIRE_THROWS_AS(PathSimulator(p, engineData()), std::invalid_argument);

    p = singleRetiree();
    p.lifeExpectancy = 64;
    REQUIRE_THROWS_AS(PathSimulator(p, engineData()), std::invalid_argument);
}
