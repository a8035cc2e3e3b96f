#include "param_parsing.hpp"

#include <catch2/catch.hpp>

using namespace retiresim;

TEST_CASE("simulation flags map onto params", "[params]") {
    const ArgMap args = {
        {"marital", "married"},  {"age1", "40"},          {"age2", "38"},
        {"retAge", "60"},        {"lifeExp", "92"},       {"sTax", "100000"},
        {"sPre", "250000"},      {"cTax1", "5000"},       {"cMatch2", "3000"},
        {"retMode", "historical"}, {"historicalYear", "1970"}, {"childrenAges", "2, 5"},
        {"includeSS", "yes"},    {"ssIncome", "80000"},   {"ssClaimAge", "70"},
        {"inflationShockRate", "8"}, {"glidePath", "ageBased"}, {"enableRothConversions", "1"},
    };
    const SimulationParams p = parseSimulationParams(args);

    REQUIRE(p.married());
    REQUIRE(p.age1 == 40);
    REQUIRE(p.age2 == 38);
    REQUIRE(p.youngerAge() == 38);
    REQUIRE(p.retirementAge == 60);
    REQUIRE(p.lifeExpectancy == 92);
    REQUIRE(p.taxableBalance == Approx(100000.0));
    REQUIRE(p.pretaxBalance == Approx(250000.0));
    REQUIRE(p.contributions1.taxable == Approx(5000.0));
    REQUIRE(p.contributions2.employerMatch == Approx(3000.0));
    REQUIRE(p.returnMode == ReturnMode::Historical);
    REQUIRE(p.historicalStartYear == 1970);
    REQUIRE(p.children.ages == std::vector<int>{2, 5});
    REQUIRE(p.includeSocialSecurity);
    REQUIRE(p.socialSecurity1.claimAge == Approx(70.0));
    REQUIRE(p.inflationShockPct.has_value());
    REQUIRE(*p.inflationShockPct == Approx(8.0));
    REQUIRE(p.glidePath.strategy == GlidePathStrategy::AgeBased);
    REQUIRE(p.rothConversion.enabled);
}

TEST_CASE("defaults apply for absent flags", "[params]") {
    const SimulationParams p = parseSimulationParams({});
    REQUIRE_FALSE(p.married());
    REQUIRE(p.retirementAge == 65);
    REQUIRE(p.returnMode == ReturnMode::Fixed);
    REQUIRE(p.withdrawalPct == Approx(4.0));
    REQUIRE_FALSE(p.inflationShockPct.has_value());

    const BatchConfig batch = parseBatchConfig({});
    REQUIRE(batch.baseSeed == 12345u);
    REQUIRE(batch.paths == 2000);
    REQUIRE(batch.progressInterval == 50);
}

TEST_CASE("return mode aliases", "[params]") {
    REQUIRE(parseReturnMode("mc") == ReturnMode::Bootstrap);
    REQUIRE(parseReturnMode("randomWalk") == ReturnMode::Bootstrap);
    REQUIRE(parseReturnMode("Fixed") == ReturnMode::Fixed);
    REQUIRE_THROWS_AS(parseReturnMode("weird"), std::invalid_argument);
}

TEST_CASE("malformed values are rejected", "[params]") {
    REQUIRE_THROWS_AS(parseSimulationParams({{"age1", "forty"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseSimulationParams({{"wdRate", "4%"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseSimulationParams({{"includeSS", "maybe"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseSimulationParams({{"marital", "divorced"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseSimulationParams({{"childrenAges", "1,x"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseBatchConfig({{"seed", "-1"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseBatchConfig({{"paths", "0"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseSpendingReduction({{"spendingReduction", "-0.2"}}), std::invalid_argument);
}

TEST_CASE("inconsistent households are rejected", "[params]") {
    REQUIRE_THROWS_AS(parseSimulationParams({{"age1", "50"}, {"retAge", "45"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseSimulationParams({{"sTax", "-1"}}), std::invalid_argument);
}

TEST_CASE("integer lists skip blanks", "[params]") {
    const ArgMap args = {{"ages", "1, 2,,3"}};
    REQUIRE(getIntList(args, "ages", {}) == std::vector<int>{1, 2, 3});
    REQUIRE(getIntList({}, "ages", {7}) == std::vector<int>{7});
}

TEST_CASE("Roth and legacy flags", "[params]") {
    const RothOptimizerParams roth =
        parseRothOptimizerParams({{"sPre", "750000"}, {"targetBracket", "0.22"}, {"marital", "married"}});
    REQUIRE(roth.pretaxBalance == Approx(750000.0));
    REQUIRE(roth.targetBracketRate == Approx(0.22));
    REQUIRE(roth.filingStatus == FilingStatus::Married);

    const LegacyParams legacy = parseLegacyParams({{"eolNominal", "5e6"}, {"initialBenAges", "3,6"}, {"capYears", "500"}});
    REQUIRE(legacy.eolNominal == Approx(5e6));
    REQUIRE(legacy.initialBeneficiaryAges == std::vector<int>{3, 6});
    REQUIRE(legacy.capYears == 500);
    REQUIRE(legacy.filingStatus == FilingStatus::Single);
    REQUIRE(parseLegacyParams({{"marital", "married"}}).filingStatus == FilingStatus::Married);
}
