#pragma once

#include "return_generator.hpp"
#include "tax_tables.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace retiresim {

struct Contributions {
    double taxable = 0.0;
    double pretax = 0.0;
    double roth = 0.0;
    double employerMatch = 0.0;

    [[nodiscard]] double total() const { return taxable + pretax + roth + employerMatch; }
    [[nodiscard]] Contributions scaled(double factor) const {
        return {taxable * factor, pretax * factor, roth * factor, employerMatch * factor};
    }
};

struct SocialSecurityElection {
    double benefitBasisIncome = 0.0;  // average indexed annual earnings
    double claimAge = 67.0;
};

struct HealthcareParams {
    bool includeMedicare = false;
    double medicarePremiumMonthly = 400.0;
    double medicalInflationPct = 5.0;
    bool includeLongTermCare = false;
    double ltcAnnualCost = 80000.0;
    double ltcProbabilityPct = 50.0;
    double ltcDurationYears = 2.5;
    int ltcOnsetAge = 82;
    bool includePreMedicare = false;
};

struct ChildrenParams {
    std::vector<int> ages;
    int count = 0;
    int additionalExpected = 0;
};

struct RothConversionPolicy {
    bool enabled = false;
    double targetBracketRate = 0.24;
};

// Immutable configuration for one simulation request. Rates are percentages
// except RothConversionPolicy::targetBracketRate, which is a decimal.
struct SimulationParams {
    FilingStatus filingStatus = FilingStatus::Single;
    int age1 = 35;
    int age2 = 35;
    int retirementAge = 65;
    int lifeExpectancy = 95;

    double taxableBalance = 0.0;
    double pretaxBalance = 0.0;
    double rothBalance = 0.0;
    double emergencyFund = 0.0;

    Contributions contributions1;
    Contributions contributions2;
    bool increaseContributions = false;
    double contributionGrowthPct = 0.0;

    double returnPct = 9.8;
    double inflationPct = 2.6;
    ReturnMode returnMode = ReturnMode::Fixed;
    ReturnSeries returnSeries = ReturnSeries::Nominal;
    int historicalStartYear = 1928;
    BondGlidePath glidePath;
    std::optional<double> inflationShockPct;
    int inflationShockYears = 5;

    double stateTaxPct = 0.0;
    double withdrawalPct = 4.0;
    double dividendYieldPct = 2.0;

    bool includeSocialSecurity = false;
    SocialSecurityElection socialSecurity1;
    SocialSecurityElection socialSecurity2;

    HealthcareParams healthcare;
    ChildrenParams children;
    RothConversionPolicy rothConversion;

    [[nodiscard]] bool married() const { return filingStatus == FilingStatus::Married; }
    [[nodiscard]] int youngerAge() const;
    [[nodiscard]] int olderAge() const;
    [[nodiscard]] int yearsToRetirement() const { return retirementAge - youngerAge(); }
    [[nodiscard]] int drawdownYears() const;
    [[nodiscard]] std::size_t trajectoryLength() const;
    [[nodiscard]] double totalContributions() const { return contributions1.total() + contributions2.total(); }

    // Throws std::invalid_argument on a fatal input error.
    void validate() const;
};

struct AccountBalances {
    double taxable = 0.0;
    double pretax = 0.0;
    double roth = 0.0;
    double taxableBasis = 0.0;

    [[nodiscard]] double total() const { return taxable + pretax + roth; }
    void clampNonNegative();
};

struct YearlyState {
    int age = 0;
    double nominal = 0.0;
    double real = 0.0;
    double cumulativeInflation = 1.0;
    AccountBalances accounts;
    double grossWithdrawal = 0.0;
    double requiredDistribution = 0.0;
    double socialSecurity = 0.0;
};

struct PathResult {
    std::vector<YearlyState> trajectory;
    double eolReal = 0.0;
    double y1AfterTaxReal = 0.0;
    bool ruined = false;
    int survivalYears = 0;
    double totalRothConversions = 0.0;
    double conversionTaxesPaid = 0.0;
};

}  // namespace retiresim
