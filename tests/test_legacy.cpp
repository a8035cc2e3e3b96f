#include "legacy_simulator.hpp"

#include <catch2/catch.hpp>

#include <cmath>

using namespace retiresim;

TEST_CASE("heavy payouts deplete the fund", "[legacy]") {
    LegacyParams params;
    params.eolNominal = 1000000.0;
    params.perBeneficiaryReal = 100000.0;
    params.initialBeneficiaryAges = {30};
    params.capYears = 200;

    const LegacyResult result = simulateLegacy(params);
    REQUIRE_FALSE(result.perpetual);
    REQUIRE(result.years >= 5);
    REQUIRE(result.years <= 30);
    REQUIRE(result.fundLeftReal == 0.0);
    REQUIRE(result.lastLivingCount >= 1.0);
}

TEST_CASE("small payouts on a large fund are perpetual", "[legacy]") {
    LegacyParams params;
    params.eolNominal = 10000000.0;
    params.perBeneficiaryReal = 1000.0;

    const LegacyResult result = simulateLegacy(params);
    REQUIRE(result.perpetual);
    REQUIRE(result.fundLeftReal == Approx(10000000.0));
}

TEST_CASE("fund value is deflated to the estate start", "[legacy]") {
    LegacyParams params;
    params.eolNominal = 10000000.0;
    params.perBeneficiaryReal = 1000.0;
    params.yearsFromStart = 10;
    params.inflationPct = 3.0;

    const LegacyResult result = simulateLegacy(params);
    REQUIRE(result.perpetual);
    REQUIRE(result.fundLeftReal == Approx(10000000.0 / std::pow(1.03, 10)));
}

TEST_CASE("a family without children ends", "[legacy]") {
    LegacyParams params;
    params.eolNominal = 1000000.0;
    params.totalFertilityRate = 0.0;
    params.initialBeneficiaryAges = {80};
    params.capYears = 100;

    const LegacyResult result = simulateLegacy(params);
    REQUIRE_FALSE(result.perpetual);
    REQUIRE(result.years == 10);
    REQUIRE(result.lastLivingCount == 0.0);
}

TEST_CASE("generation checkpoints record the estate", "[legacy]") {
    LegacyParams params;
    params.eolNominal = 1000000.0;
    params.perBeneficiaryReal = 0.0;
    params.capYears = 200;

    const LegacyResult result = simulateLegacy(params);
    REQUIRE_FALSE(result.perpetual);
    REQUIRE(result.years == 200);
    REQUIRE(result.generations.size() == 6);
    for (std::size_t i = 0; i < result.generations.size(); ++i) {
        const GenerationCheckpoint& g = result.generations[i];
        REQUIRE(g.generation == static_cast<int>(i) + 1);
        REQUIRE(g.year == 30 * (static_cast<int>(i) + 1));
        REQUIRE(g.netToHeirs == Approx(g.estateValue - g.estateTax));
        REQUIRE(g.estateTax >= 0.0);
        REQUIRE(g.livingBeneficiaries > 0.0);
    }
}

TEST_CASE("a growing family over centuries stays tractable", "[legacy]") {
    LegacyParams params;
    params.eolNominal = 10000000.0;
    params.perBeneficiaryReal = 0.0;
    params.totalFertilityRate = 2.5;
    params.capYears = 400;

    const LegacyResult result = simulateLegacy(params);
    REQUIRE_FALSE(result.perpetual);
    REQUIRE(result.years == 400);
    REQUIRE(result.lastLivingCount > 1.0);
    REQUIRE(result.generations.size() == 10);
}

TEST_CASE("estate tax uses an inflating exemption per filing status", "[legacy]") {
    LegacyParams params;
    params.eolNominal = 100000000.0;
    params.perBeneficiaryReal = 0.0;
    params.yearsFromStart = 5;
    params.capYears = 100;

    params.filingStatus = FilingStatus::Single;
    const LegacyResult single = simulateLegacy(params);
    params.filingStatus = FilingStatus::Married;
    const LegacyResult married = simulateLegacy(params);

    REQUIRE(single.generations.size() == 3);
    REQUIRE(married.generations.size() == 3);
    for (std::size_t i = 0; i < single.generations.size(); ++i) {
        const GenerationCheckpoint& s = single.generations[i];
        const GenerationCheckpoint& m = married.generations[i];
        const double growth = std::pow(1.026, params.yearsFromStart + s.year);
        REQUIRE(s.estateTax > 0.0);
        REQUIRE(m.estateTax > 0.0);
        REQUIRE(s.estateTax == Approx((s.estateValue - 13610000.0 * growth) * 0.40));
        REQUIRE(m.estateTax == Approx((m.estateValue - 27220000.0 * growth) * 0.40));
        REQUIRE(s.estateValue == Approx(m.estateValue));
        REQUIRE(m.estateTax < s.estateTax);
    }
}

TEST_CASE("legacy input is validated", "[legacy]") {
    LegacyParams params;
    params.capYears = -1;
    REQUIRE_THROWS_AS(simulateLegacy(params), std::invalid_argument);
    params = LegacyParams();
    params.generationLength = 0;
    REQUIRE_THROWS_AS(simulateLegacy(params), std::invalid_argument);
}
