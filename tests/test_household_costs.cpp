#include "household_costs.hpp"

#include <catch2/catch.hpp>

#include <vector>

using namespace retiresim;

TEST_CASE("child ages default and expected births", "[household]") {
    ChildrenParams children;
    children.count = 2;
    REQUIRE(effectiveChildAges(children, 10) == std::vector<int>{5, 8});

    children.ages = {1, 4};
    REQUIRE(effectiveChildAges(children, 10) == std::vector<int>{1, 4});

    children.additionalExpected = 3;
    REQUIRE(effectiveChildAges(children, 10) == std::vector<int>{1, 4, -2, -4, -6});
    // Births stop at retirement.
    REQUIRE(effectiveChildAges(children, 3) == std::vector<int>{1, 4, -2});
}

TEST_CASE("child expenses by life stage", "[household]") {
    REQUIRE(childExpenses({3}, 0, 1.0) == Approx(15000.0 + 8000.0));
    REQUIRE(childExpenses({10}, 0, 1.0) == Approx(3000.0 + 8000.0 * 0.85));
    REQUIRE(childExpenses({20}, 0, 1.0) == Approx(25000.0 + 4000.0));
    REQUIRE(childExpenses({22}, 0, 1.0) == 0.0);

    // Unborn children cost nothing until birth.
    REQUIRE(childExpenses({-2}, 0, 1.0) == 0.0);
    REQUIRE(childExpenses({-2}, 2, 1.1) == Approx(23000.0 * 1.1));
}

TEST_CASE("dependent children stay on the plan through 25", "[household]") {
    const std::vector<int> ages = {-1, 10, 25, 26};
    REQUIRE(dependentChildCount(ages, 0) == 2);
    REQUIRE(dependentChildCount(ages, 1) == 2);
}

TEST_CASE("pre-Medicare premiums rise with age", "[household][healthcare]") {
    const TaxTables tables = TaxTables::us2026();
    REQUIRE(preMedicarePremium(25, tables) == Approx(4800.0));
    REQUIRE(preMedicarePremium(45, tables) == Approx(8400.0));
    REQUIRE(preMedicarePremium(62, tables) == Approx(15600.0));
    REQUIRE(preMedicarePremium(65, tables) == 0.0);

    REQUIRE(preMedicareHealthcareCost(62, 66, 1, 1.0, tables) == Approx(15600.0 + 3000.0));
    REQUIRE(preMedicareHealthcareCost(66, std::nullopt, 2, 1.0, tables) == 0.0);
    REQUIRE(preMedicareHealthcareCost(50, std::nullopt, 0, 1.5, tables) == Approx(13200.0 * 1.5));
}

TEST_CASE("retirement healthcare costs", "[household][healthcare]") {
    const TaxTables tables = TaxTables::us2026();
    HealthcareParams healthcare;
    healthcare.includeMedicare = true;
    healthcare.medicarePremiumMonthly = 400.0;

    REQUIRE(retirementHealthcareCost(healthcare, 64, 0, 50000.0, FilingStatus::Single, tables).total() == 0.0);

    const RetirementHealthcareCost base =
        retirementHealthcareCost(healthcare, 70, 0, 50000.0, FilingStatus::Single, tables);
    REQUIRE(base.medicare == Approx(4800.0));
    REQUIRE(base.irmaa == 0.0);

    const RetirementHealthcareCost high =
        retirementHealthcareCost(healthcare, 70, 0, 150000.0, FilingStatus::Single, tables);
    REQUIRE(high.irmaa == Approx(202.9 * 12.0));

    healthcare.includeMedicare = false;
    healthcare.includeLongTermCare = true;
    healthcare.ltcAnnualCost = 80000.0;
    healthcare.ltcProbabilityPct = 50.0;
    healthcare.ltcOnsetAge = 82;
    healthcare.ltcDurationYears = 2.5;
    REQUIRE(retirementHealthcareCost(healthcare, 81, 0, 0.0, FilingStatus::Single, tables).longTermCare == 0.0);
    REQUIRE(retirementHealthcareCost(healthcare, 84, 0, 0.0, FilingStatus::Single, tables).longTermCare ==
            Approx(40000.0));
    REQUIRE(retirementHealthcareCost(healthcare, 85, 0, 0.0, FilingStatus::Single, tables).longTermCare == 0.0);
}
