#pragma once

#include "simulation_params.hpp"
#include "tax_tables.hpp"

#include <optional>

namespace retiresim {

// Progressive federal tax on ordinary income after the standard deduction.
[[nodiscard]] double ordinaryIncomeTax(double income, FilingStatus status, const TaxTables& tables);

// Long-term gains tax with the 0/15/20% thresholds consumed first by
// ordinaryIncome.
[[nodiscard]] double capitalGainsTax(double gains,
                                     FilingStatus status,
                                     double ordinaryIncome,
                                     const TaxTables& tables);

[[nodiscard]] double netInvestmentIncomeTax(double investmentIncome,
                                            FilingStatus status,
                                            double modifiedAgi,
                                            const TaxTables& tables);

// Zero below the RMD start age or for a non-positive balance.
[[nodiscard]] double requiredMinimumDistribution(double pretaxBalance, int age, const TaxTables& tables);

// Gross income ceiling (bracket limit + standard deduction) of the bracket
// taxed at `rate`, if the schedule has one.
[[nodiscard]] std::optional<double> bracketIncomeCeiling(double rate, FilingStatus status, const TaxTables& tables);

[[nodiscard]] double irmaaMonthlySurcharge(double magi, FilingStatus status, const TaxTables& tables);

// Monthly primary insurance amount from average annual indexed earnings.
[[nodiscard]] double primaryInsuranceAmount(double averageAnnualIncome, const TaxTables& tables);

// Multiplier applied to the PIA for claiming at claimAge.
[[nodiscard]] double claimAdjustmentFactor(double claimAge, const TaxTables& tables);

// Annual benefit for a worker claiming on their own record.
[[nodiscard]] double annualSocialSecurityBenefit(double averageAnnualIncome, double claimAge, const TaxTables& tables);

// Monthly benefit: the larger of the worker's own adjusted PIA and the
// spousal share of the partner's PIA.
[[nodiscard]] double spousalAwareMonthlyBenefit(double ownPia,
                                                double spousePia,
                                                double ownClaimAge,
                                                const TaxTables& tables);

struct WithdrawalDraw {
    double taxable = 0.0;
    double pretax = 0.0;
    double roth = 0.0;
};

struct WithdrawalTaxes {
    double total = 0.0;
    double federalOrdinary = 0.0;
    double federalCapitalGains = 0.0;
    double niit = 0.0;
    double state = 0.0;
    WithdrawalDraw draw;
    double newBasis = 0.0;
};

struct WithdrawalRequest {
    double gross = 0.0;
    double minPretaxDraw = 0.0;       // RMD floor satisfied from the pre-tax bucket first
    double baseOrdinaryIncome = 0.0;  // income already stacked below this withdrawal
    double stateTaxPct = 0.0;
};

// Splits a gross withdrawal across the three buckets and taxes it at the
// margin above baseOrdinaryIncome.
[[nodiscard]] WithdrawalTaxes computeWithdrawalTaxes(const WithdrawalRequest& request,
                                                     const AccountBalances& balances,
                                                     FilingStatus status,
                                                     const TaxTables& tables);

}  // namespace retiresim
