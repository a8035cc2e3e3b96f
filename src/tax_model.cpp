#include "tax_model.hpp"

#include <algorithm>
#include <cmath>

namespace retiresim {

namespace {

constexpr double kRateTolerance = 1e-9;

double sanitize(double value) {
    return std::isfinite(value) ? std::max(0.0, value) : 0.0;
}

}  // namespace

double ordinaryIncomeTax(double income, FilingStatus status, const TaxTables& tables) {
    const double safeIncome = sanitize(income);
    if (safeIncome <= 0.0) return 0.0;

    const BracketSchedule& schedule = tables.ordinary(status);
    double remaining = std::max(0.0, safeIncome - schedule.standardDeduction);
    double tax = 0.0;
    double previousLimit = 0.0;
    for (const auto& bracket : schedule.brackets) {
        if (remaining <= 0.0) break;
        const double amount = std::min(remaining, bracket.limit - previousLimit);
        tax += amount * bracket.rate;
        remaining -= amount;
        previousLimit = bracket.limit;
    }
    if (remaining > 0.0) {
        tax += remaining * schedule.brackets.back().rate;
    }
    return tax;
}

double capitalGainsTax(double gains, FilingStatus status, double ordinaryIncome, const TaxTables& tables) {
    double remainingGain = sanitize(gains);
    if (remainingGain <= 0.0) return 0.0;

    const auto& brackets = tables.capitalGains(status);
    double stacked = sanitize(ordinaryIncome);
    double tax = 0.0;
    for (const auto& bracket : brackets) {
        const double room = std::max(0.0, bracket.limit - stacked);
        const double taxedHere = std::min(remainingGain, room);
        if (taxedHere > 0.0) {
            tax += taxedHere * bracket.rate;
            remainingGain -= taxedHere;
            stacked += taxedHere;
        }
        if (remainingGain <= 0.0) break;
    }
    if (remainingGain > 0.0) {
        tax += remainingGain * brackets.back().rate;
    }
    return tax;
}

double netInvestmentIncomeTax(double investmentIncome,
                              FilingStatus status,
                              double modifiedAgi,
                              const TaxTables& tables) {
    const double income = sanitize(investmentIncome);
    if (income <= 0.0) return 0.0;
    const double excess = std::max(0.0, sanitize(modifiedAgi) - tables.niitThreshold(status));
    if (excess <= 0.0) return 0.0;
    return std::min(income, excess) * tables.niitRate;
}

double requiredMinimumDistribution(double pretaxBalance, int age, const TaxTables& tables) {
    if (age < tables.rmdStartAge || pretaxBalance <= 0.0) return 0.0;
    return pretaxBalance / tables.rmdDivisor(age);
}

std::optional<double> bracketIncomeCeiling(double rate, FilingStatus status, const TaxTables& tables) {
    const BracketSchedule& schedule = tables.ordinary(status);
    for (const auto& bracket : schedule.brackets) {
        if (std::abs(bracket.rate - rate) < kRateTolerance) {
            return bracket.limit + schedule.standardDeduction;
        }
    }
    return std::nullopt;
}

double irmaaMonthlySurcharge(double magi, FilingStatus status, const TaxTables& tables) {
    const auto& tiers = tables.irmaa(status);
    for (const auto& tier : tiers) {
        if (magi <= tier.magiThreshold) {
            return tier.monthlySurcharge;
        }
    }
    return tiers.back().monthlySurcharge;
}

double primaryInsuranceAmount(double averageAnnualIncome, const TaxTables& tables) {
    if (averageAnnualIncome <= 0.0) return 0.0;
    const SocialSecurityRules& ss = tables.socialSecurity;
    const double aime = averageAnnualIncome / 12.0;

    if (aime <= ss.firstBendPoint) {
        return aime * ss.firstReplacementRate;
    }
    const double firstTier = ss.firstBendPoint * ss.firstReplacementRate;
    if (aime <= ss.secondBendPoint) {
        return firstTier + (aime - ss.firstBendPoint) * ss.secondReplacementRate;
    }
    return firstTier + (ss.secondBendPoint - ss.firstBendPoint) * ss.secondReplacementRate +
           (aime - ss.secondBendPoint) * ss.thirdReplacementRate;
}

double claimAdjustmentFactor(double claimAge, const TaxTables& tables) {
    const SocialSecurityRules& ss = tables.socialSecurity;
    const double monthsFromFra = (claimAge - ss.fullRetirementAge) * 12.0;

    if (monthsFromFra < 0.0) {
        const double earlyMonths = -monthsFromFra;
        if (earlyMonths <= ss.reducedMonthsTier) {
            return 1.0 - earlyMonths * ss.earlyReductionPerMonth;
        }
        return 1.0 - ss.reducedMonthsTier * ss.earlyReductionPerMonth -
               (earlyMonths - ss.reducedMonthsTier) * ss.extendedReductionPerMonth;
    }
    return 1.0 + monthsFromFra * ss.delayedCreditPerMonth;
}

double annualSocialSecurityBenefit(double averageAnnualIncome, double claimAge, const TaxTables& tables) {
    if (averageAnnualIncome <= 0.0) return 0.0;
    return primaryInsuranceAmount(averageAnnualIncome, tables) * claimAdjustmentFactor(claimAge, tables) * 12.0;
}

double spousalAwareMonthlyBenefit(double ownPia, double spousePia, double ownClaimAge, const TaxTables& tables) {
    const SocialSecurityRules& ss = tables.socialSecurity;
    const double ownBenefit = ownPia > 0.0 ? ownPia * claimAdjustmentFactor(ownClaimAge, tables) : 0.0;

    double spousalBenefit = spousePia * ss.spousalShare;
    if (ownClaimAge < ss.fullRetirementAge) {
        const double monthsEarly = (ss.fullRetirementAge - ownClaimAge) * 12.0;
        if (monthsEarly <= ss.reducedMonthsTier) {
            spousalBenefit *= 1.0 - monthsEarly * ss.spousalReductionPerMonth;
        } else {
            spousalBenefit *= 1.0 - ss.reducedMonthsTier * ss.spousalReductionPerMonth -
                              (monthsEarly - ss.reducedMonthsTier) * ss.extendedReductionPerMonth;
        }
    }
    return std::max(ownBenefit, spousalBenefit);
}

WithdrawalTaxes computeWithdrawalTaxes(const WithdrawalRequest& request,
                                       const AccountBalances& balances,
                                       FilingStatus status,
                                       const TaxTables& tables) {
    const double taxableBal = sanitize(balances.taxable);
    const double pretaxBal = sanitize(balances.pretax);
    const double rothBal = sanitize(balances.roth);
    const double basis = sanitize(balances.taxableBasis);
    const double gross = sanitize(request.gross);
    const double statePct = std::min(100.0, sanitize(request.stateTaxPct));
    const double baseIncome = sanitize(request.baseOrdinaryIncome);

    WithdrawalTaxes out;
    out.newBasis = basis;
    if (taxableBal + pretaxBal + rothBal <= 0.0 || gross <= 0.0) {
        return out;
    }

    // RMD floor first, then the rest pro-rata across what remains.
    double drawP = std::min(sanitize(request.minPretaxDraw), pretaxBal);
    double drawT = 0.0;
    double drawR = 0.0;
    const double remainingNeed = gross - drawP;
    if (remainingNeed > 0.0) {
        const double available = taxableBal + (pretaxBal - drawP) + rothBal;
        if (available > 0.0) {
            drawT = remainingNeed * (taxableBal / available);
            drawR = remainingNeed * (rothBal / available);
            drawP += remainingNeed * ((pretaxBal - drawP) / available);
        }
    }

    // Shortfall cascades taxable -> pre-tax -> Roth.
    const double usedT = std::min(drawT, taxableBal);
    const double shortT = drawT - usedT;
    const double usedP = std::min(drawP + shortT, pretaxBal);
    const double shortP = drawP + shortT - usedP;
    const double usedR = std::min(drawR + shortP, rothBal);

    out.draw = {usedT, usedP, usedR};

    const double unrealizedGain = std::max(0.0, taxableBal - basis);
    const double gainRatio = taxableBal > 0.0 ? unrealizedGain / taxableBal : 0.0;
    const double capitalGains = usedT * gainRatio;
    const double basisDrawn = usedT - capitalGains;

    const double totalOrdinary = baseIncome + usedP;
    out.federalOrdinary = ordinaryIncomeTax(totalOrdinary, status, tables) - ordinaryIncomeTax(baseIncome, status, tables);
    out.federalCapitalGains = capitalGainsTax(capitalGains, status, totalOrdinary, tables);
    out.niit = netInvestmentIncomeTax(capitalGains, status, totalOrdinary + capitalGains, tables);
    out.state = (usedP + capitalGains) * (statePct / 100.0);
    out.total = out.federalOrdinary + out.federalCapitalGains + out.niit + out.state;
    out.newBasis = std::max(0.0, basis - basisDrawn);
    return out;
}

}  // namespace retiresim
