#pragma once

#include "tax_tables.hpp"

#include <string>
#include <vector>

namespace retiresim {

struct RothOptimizerParams {
    FilingStatus filingStatus = FilingStatus::Single;
    int retirementAge = 65;
    int lifeExpectancy = 95;
    double pretaxBalance = 0.0;
    double socialSecurityIncome = 0.0;  // annual
    double annualWithdrawal = 0.0;
    double targetBracketRate = 0.24;    // decimal
    double growthRate = 0.07;           // decimal
};

struct RmdRow {
    int age = 0;
    double rmd = 0.0;
    double tax = 0.0;
};

struct ConversionRow {
    int age = 0;
    double amount = 0.0;
    double tax = 0.0;
    double pretaxBalanceBefore = 0.0;
};

struct ConversionWindow {
    int startAge = 0;
    int endAge = 0;
    int years = 0;
};

struct RothOptimizerResult {
    bool hasRecommendation = false;
    std::string reason;  // set only for the early exits

    std::vector<ConversionRow> conversions;
    ConversionWindow window;
    double totalConverted = 0.0;
    double avgAnnualConversion = 0.0;
    double lifetimeTaxSavings = 0.0;
    double baselineLifetimeTax = 0.0;
    double optimizedLifetimeTax = 0.0;
    double rmdReduction = 0.0;
    double rmdReductionPercent = 0.0;
    double effectiveRateImprovement = 0.0;  // percentage points
    std::vector<RmdRow> baselineRmds;       // first ten RMD years
    std::vector<RmdRow> optimizedRmds;
    double targetBracketRate = 0.0;
    double targetBracketLimit = 0.0;
};

// Deterministic comparison of lifetime tax with and without filling the
// target bracket with Roth conversions between retirement and RMD age.
[[nodiscard]] RothOptimizerResult optimizeRothConversions(const RothOptimizerParams& params, const TaxTables& tables);

}  // namespace retiresim
