#include "roth_optimizer.hpp"

#include "tax_model.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace retiresim {

namespace {

constexpr double kMinimumConversion = 5000.0;
constexpr double kFallbackLimitMarried = 394600.0;
constexpr double kFallbackLimitSingle = 197300.0;
constexpr std::size_t kReportedRmdRows = 10;

double targetLimit(double rate, FilingStatus status, const TaxTables& tables) {
    for (const auto& bracket : tables.ordinary(status).brackets) {
        if (std::abs(bracket.rate - rate) < 1e-9 && std::isfinite(bracket.limit)) {
            return bracket.limit;
        }
    }
    return status == FilingStatus::Married ? kFallbackLimitMarried : kFallbackLimitSingle;
}

struct RmdPhase {
    std::vector<RmdRow> rows;
    double totalTax = 0.0;
    double totalRmd = 0.0;
};

RmdPhase runRmdPhase(double pretax, const RothOptimizerParams& params, const TaxTables& tables) {
    RmdPhase phase;
    for (int age = tables.rmdStartAge; age <= params.lifeExpectancy; ++age) {
        const double rmd = requiredMinimumDistribution(pretax, age, tables);
        const double tax = ordinaryIncomeTax(rmd + params.socialSecurityIncome, params.filingStatus, tables);
        phase.rows.push_back({age, rmd, tax});
        phase.totalTax += tax;
        phase.totalRmd += rmd;
        pretax = (pretax - rmd) * (1.0 + params.growthRate);
    }
    return phase;
}

}  // namespace

RothOptimizerResult optimizeRothConversions(const RothOptimizerParams& params, const TaxTables& tables) {
    if (params.lifeExpectancy <= params.retirementAge) {
        throw std::invalid_argument("RothOptimizerParams.lifeExpectancy must exceed the retirement age");
    }
    if (params.growthRate <= -1.0) {
        throw std::invalid_argument("RothOptimizerParams.growthRate must exceed -100%");
    }

    RothOptimizerResult result;
    if (params.pretaxBalance <= 0.0) {
        result.reason = "No pre-tax balance to convert";
        return result;
    }
    const int conversionYears = std::max(0, tables.rmdStartAge - params.retirementAge);
    if (conversionYears <= 0) {
        result.reason = "Already at or past RMD age";
        return result;
    }

    const FilingStatus status = params.filingStatus;
    const double deduction = tables.ordinary(status).standardDeduction;
    const double limit = targetLimit(params.targetBracketRate, status, tables);

    const RmdPhase baseline = runRmdPhase(params.pretaxBalance, params, tables);

    // Conversions are taxed at the margin above the year's other income; the
    // tax is paid from outside the pre-tax account.
    double pretax = params.pretaxBalance;
    double conversionTax = 0.0;
    const double baseIncome = params.socialSecurityIncome + params.annualWithdrawal;
    const double baseTax = ordinaryIncomeTax(baseIncome, status, tables);
    for (int age = params.retirementAge; age < tables.rmdStartAge; ++age) {
        const double room = std::max(0.0, limit - std::max(0.0, baseIncome - deduction));
        const double amount = std::min(room, pretax);
        if (amount > kMinimumConversion) {
            const double tax = ordinaryIncomeTax(baseIncome + amount, status, tables) - baseTax;
            result.conversions.push_back({age, amount, tax, pretax});
            result.totalConverted += amount;
            conversionTax += tax;
            pretax -= amount;
        }
        pretax *= 1.0 + params.growthRate;
    }
    const RmdPhase optimized = runRmdPhase(pretax, params, tables);

    result.window = {params.retirementAge, tables.rmdStartAge - 1, conversionYears};
    result.baselineLifetimeTax = baseline.totalTax;
    result.optimizedLifetimeTax = optimized.totalTax + conversionTax;
    result.lifetimeTaxSavings = result.baselineLifetimeTax - result.optimizedLifetimeTax;
    result.avgAnnualConversion =
        result.conversions.empty() ? 0.0 : result.totalConverted / static_cast<double>(result.conversions.size());
    result.rmdReduction = baseline.totalRmd - optimized.totalRmd;
    result.rmdReductionPercent = baseline.totalRmd > 0.0 ? result.rmdReduction / baseline.totalRmd * 100.0 : 0.0;

    const double baselineRate = baseline.totalRmd > 0.0 ? baseline.totalTax / baseline.totalRmd : 0.0;
    const double optimizedBase = optimized.totalRmd + result.totalConverted;
    const double optimizedRate = optimizedBase > 0.0 ? result.optimizedLifetimeTax / optimizedBase : 0.0;
    result.effectiveRateImprovement = (baselineRate - optimizedRate) * 100.0;

    const auto firstRows = [](const std::vector<RmdRow>& rows) {
        return std::vector<RmdRow>(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(
                                                                    std::min(kReportedRmdRows, rows.size())));
    };
    result.baselineRmds = firstRows(baseline.rows);
    result.optimizedRmds = firstRows(optimized.rows);
    result.targetBracketRate = params.targetBracketRate;
    result.targetBracketLimit = limit;
    result.hasRecommendation = !result.conversions.empty() && result.lifetimeTaxSavings > 0.0;
    return result;
}

}  // namespace retiresim
