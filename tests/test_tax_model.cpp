#include "tax_model.hpp"

#include <catch2/catch.hpp>

#include <utility>

using namespace retiresim;

namespace {

const TaxTables& tables() {
    static const TaxTables t = TaxTables::us2026();
    return t;
}

}  // namespace

TEST_CASE("us2026 tables validate", "[tax]") {
    REQUIRE_NOTHROW(tables().validate());
}

TEST_CASE("validate rejects out-of-order brackets", "[tax]") {
    TaxTables broken = TaxTables::us2026();
    std::swap(broken.ordinarySingle.brackets[0], broken.ordinarySingle.brackets[1]);
    REQUIRE_THROWS_AS(broken.validate(), std::invalid_argument);
}

TEST_CASE("ordinary income tax applies the standard deduction", "[tax]") {
    REQUIRE(ordinaryIncomeTax(16100.0, FilingStatus::Single, tables()) == Approx(0.0));
    REQUIRE(ordinaryIncomeTax(16100.0 + 12400.0, FilingStatus::Single, tables()) == Approx(1240.0));
    REQUIRE(ordinaryIncomeTax(32200.0 + 24800.0, FilingStatus::Married, tables()) == Approx(2480.0));
    REQUIRE(ordinaryIncomeTax(-500.0, FilingStatus::Single, tables()) == 0.0);
}

TEST_CASE("ordinary income tax is monotone and continuous", "[tax]") {
    for (FilingStatus status : {FilingStatus::Single, FilingStatus::Married}) {
        double previous = 0.0;
        for (double income = 0.0; income <= 1500000.0; income += 2500.0) {
            const double tax = ordinaryIncomeTax(income, status, tables());
            REQUIRE(tax >= previous);
            previous = tax;
        }

        const BracketSchedule& schedule = tables().ordinary(status);
        for (std::size_t i = 0; i + 1 < schedule.brackets.size(); ++i) {
            const double edge = schedule.brackets[i].limit + schedule.standardDeduction;
            const double below = ordinaryIncomeTax(edge - 1.0, status, tables());
            const double at = ordinaryIncomeTax(edge, status, tables());
            const double above = ordinaryIncomeTax(edge + 1.0, status, tables());
            REQUIRE(at - below == Approx(schedule.brackets[i].rate).margin(1e-6));
            REQUIRE(above - at == Approx(schedule.brackets[i + 1].rate).margin(1e-6));
        }
    }
}

TEST_CASE("capital gains stack on top of ordinary income", "[tax]") {
    REQUIRE(capitalGainsTax(40000.0, FilingStatus::Single, 0.0, tables()) == Approx(0.0));
    REQUIRE(capitalGainsTax(10000.0, FilingStatus::Single, 49450.0, tables()) == Approx(1500.0));
    // 5000 still fits in the 0% band, the remainder is taxed at 15%.
    REQUIRE(capitalGainsTax(10000.0, FilingStatus::Single, 44450.0, tables()) == Approx(750.0));
    REQUIRE(capitalGainsTax(0.0, FilingStatus::Married, 1e6, tables()) == 0.0);
}

TEST_CASE("net investment income tax above the threshold", "[tax]") {
    REQUIRE(netInvestmentIncomeTax(50000.0, FilingStatus::Single, 150000.0, tables()) == 0.0);
    REQUIRE(netInvestmentIncomeTax(50000.0, FilingStatus::Single, 210000.0, tables()) == Approx(380.0));
    REQUIRE(netInvestmentIncomeTax(5000.0, FilingStatus::Married, 400000.0, tables()) == Approx(190.0));
}

TEST_CASE("required minimum distributions", "[tax][rmd]") {
    REQUIRE(requiredMinimumDistribution(500000.0, 72, tables()) == 0.0);
    REQUIRE(requiredMinimumDistribution(265000.0, 73, tables()) == Approx(10000.0));
    REQUIRE(requiredMinimumDistribution(0.0, 80, tables()) == 0.0);
    REQUIRE(tables().rmdDivisor(121) == Approx(tables().rmdFallbackDivisor));

    double previous = tables().rmdDivisor(73);
    for (int age = 74; age <= 120; ++age) {
        REQUIRE(tables().rmdDivisor(age) <= previous);
        previous = tables().rmdDivisor(age);
    }
}

TEST_CASE("bracket ceiling includes the deduction", "[tax]") {
    const auto ceiling = bracketIncomeCeiling(0.24, FilingStatus::Single, tables());
    REQUIRE(ceiling.has_value());
    REQUIRE(*ceiling == Approx(201775.0 + 16100.0));
    REQUIRE_FALSE(bracketIncomeCeiling(0.25, FilingStatus::Single, tables()).has_value());
}

TEST_CASE("IRMAA tiers", "[tax][medicare]") {
    REQUIRE(irmaaMonthlySurcharge(100000.0, FilingStatus::Single, tables()) == 0.0);
    REQUIRE(irmaaMonthlySurcharge(109000.0, FilingStatus::Single, tables()) == 0.0);
    REQUIRE(irmaaMonthlySurcharge(150000.0, FilingStatus::Single, tables()) == Approx(202.9));
    REQUIRE(irmaaMonthlySurcharge(5e6, FilingStatus::Married, tables()) == Approx(487.0));
}

TEST_CASE("social security benefit formula", "[tax][ss]") {
    REQUIRE(primaryInsuranceAmount(0.0, tables()) == 0.0);
    REQUIRE(primaryInsuranceAmount(1286.0 * 12.0, tables()) == Approx(1286.0 * 0.9));

    REQUIRE(claimAdjustmentFactor(67.0, tables()) == Approx(1.0));
    REQUIRE(claimAdjustmentFactor(64.0, tables()) == Approx(0.8));
    REQUIRE(claimAdjustmentFactor(62.0, tables()) == Approx(0.7));
    REQUIRE(claimAdjustmentFactor(70.0, tables()) == Approx(1.24));

    double previous = claimAdjustmentFactor(62.0, tables());
    for (double age = 62.25; age <= 70.0; age += 0.25) {
        const double factor = claimAdjustmentFactor(age, tables());
        REQUIRE(factor > previous);
        previous = factor;
    }

    REQUIRE(annualSocialSecurityBenefit(1286.0 * 12.0, 67.0, tables()) == Approx(1286.0 * 0.9 * 12.0));
}

TEST_CASE("spousal benefit takes the larger entitlement", "[tax][ss]") {
    REQUIRE(spousalAwareMonthlyBenefit(0.0, 2000.0, 67.0, tables()) == Approx(1000.0));
    REQUIRE(spousalAwareMonthlyBenefit(1500.0, 2000.0, 67.0, tables()) == Approx(1500.0));
    REQUIRE(spousalAwareMonthlyBenefit(0.0, 2000.0, 64.0, tables()) == Approx(750.0));
}

TEST_CASE("withdrawal draws pro-rata and taxes each bucket", "[tax][withdrawal]") {
    AccountBalances balances;
    balances.taxable = 100000.0;
    balances.pretax = 100000.0;
    balances.roth = 100000.0;
    balances.taxableBasis = 50000.0;

    WithdrawalRequest request;
    request.gross = 30000.0;
    const WithdrawalTaxes taxes = computeWithdrawalTaxes(request, balances, FilingStatus::Single, tables());

    REQUIRE(taxes.draw.taxable == Approx(10000.0));
    REQUIRE(taxes.draw.pretax == Approx(10000.0));
    REQUIRE(taxes.draw.roth == Approx(10000.0));
    REQUIRE(taxes.newBasis == Approx(45000.0));
    REQUIRE(taxes.federalOrdinary == Approx(0.0));
    REQUIRE(taxes.federalCapitalGains == Approx(0.0));
    REQUIRE(taxes.total == Approx(taxes.federalOrdinary + taxes.federalCapitalGains + taxes.niit + taxes.state));
}

TEST_CASE("withdrawal satisfies the RMD floor first", "[tax][withdrawal]") {
    AccountBalances balances;
    balances.taxable = 100000.0;
    balances.pretax = 100000.0;
    balances.taxableBasis = 100000.0;

    WithdrawalRequest request;
    request.gross = 20000.0;
    request.minPretaxDraw = 20000.0;
    request.stateTaxPct = 5.0;
    const WithdrawalTaxes taxes = computeWithdrawalTaxes(request, balances, FilingStatus::Single, tables());

    REQUIRE(taxes.draw.pretax == Approx(20000.0));
    REQUIRE(taxes.draw.taxable == Approx(0.0));
    REQUIRE(taxes.federalOrdinary == Approx((20000.0 - 16100.0) * 0.10));
    REQUIRE(taxes.state == Approx(1000.0));
}

TEST_CASE("withdrawal shortfall cascades and never overdraws", "[tax][withdrawal]") {
    AccountBalances balances;
    balances.taxable = 100.0;
    balances.pretax = 100.0;
    balances.roth = 100.0;
    balances.taxableBasis = 100.0;

    WithdrawalRequest request;
    request.gross = 600.0;
    const WithdrawalTaxes taxes = computeWithdrawalTaxes(request, balances, FilingStatus::Married, tables());

    REQUIRE(taxes.draw.taxable == Approx(100.0));
    REQUIRE(taxes.draw.pretax == Approx(100.0));
    REQUIRE(taxes.draw.roth == Approx(100.0));
}

TEST_CASE("withdrawal from empty accounts is free", "[tax][withdrawal]") {
    WithdrawalRequest request;
    request.gross = 5000.0;
    const WithdrawalTaxes taxes = computeWithdrawalTaxes(request, AccountBalances{}, FilingStatus::Single, tables());
    REQUIRE(taxes.total == 0.0);
    REQUIRE(taxes.draw.taxable + taxes.draw.pretax + taxes.draw.roth == 0.0);
}
