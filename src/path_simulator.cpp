#include "path_simulator.hpp"

#include "household_costs.hpp"
#include "return_generator.hpp"
#include "tax_model.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

namespace retiresim {

namespace {

// Contribution deposited evenly through the year earns half the year's growth.
inline double midYear(double amount, double growthFactor) {
    return amount * (1.0 + (growthFactor - 1.0) * 0.5);
}

void deposit(AccountBalances& accounts, const Contributions& c, double growthFactor) {
    accounts.taxable += midYear(c.taxable, growthFactor);
    accounts.pretax += midYear(c.pretax + c.employerMatch, growthFactor);
    accounts.roth += midYear(c.roth, growthFactor);
    accounts.taxableBasis += c.taxable;
}

}  // namespace

PathSimulator::PathSimulator(SimulationParams params, const EngineData& data)
    : params_(std::move(params)), data_(data) {
    params_.validate();
}

ReturnGeneratorConfig PathSimulator::generatorConfig(std::size_t years,
                                                     std::uint32_t seed,
                                                     int startYear,
                                                     int currentAge) const {
    ReturnGeneratorConfig config;
    config.mode = params_.returnMode;
    config.years = years;
    config.nominalPct = params_.returnPct;
    config.inflationPct = params_.inflationPct;
    config.series = params_.returnSeries;
    config.seed = seed;
    config.startYear = startYear;
    config.currentAge = currentAge;
    config.glidePath = params_.glidePath;
    return config;
}

double PathSimulator::householdSocialSecurity(int age1, int age2) const {
    if (!params_.includeSocialSecurity) return 0.0;

    const TaxTables& tables = data_.tables;
    const SocialSecurityElection& ss1 = params_.socialSecurity1;
    const SocialSecurityElection& ss2 = params_.socialSecurity2;
    const bool claimed1 = static_cast<double>(age1) >= ss1.claimAge;

    if (!params_.married()) {
        return claimed1 ? annualSocialSecurityBenefit(ss1.benefitBasisIncome, ss1.claimAge, tables) : 0.0;
    }

    const bool claimed2 = static_cast<double>(age2) >= ss2.claimAge;
    if (claimed1 && claimed2) {
        const double pia1 = primaryInsuranceAmount(ss1.benefitBasisIncome, tables);
        const double pia2 = primaryInsuranceAmount(ss2.benefitBasisIncome, tables);
        return (spousalAwareMonthlyBenefit(pia1, pia2, ss1.claimAge, tables) +
                spousalAwareMonthlyBenefit(pia2, pia1, ss2.claimAge, tables)) *
               12.0;
    }
    if (claimed1) return annualSocialSecurityBenefit(ss1.benefitBasisIncome, ss1.claimAge, tables);
    if (claimed2) return annualSocialSecurityBenefit(ss2.benefitBasisIncome, ss2.claimAge, tables);
    return 0.0;
}

double PathSimulator::yieldDragTax(double taxableBalance) const {
    if (taxableBalance <= 0.0 || params_.dividendYieldPct <= 0.0) return 0.0;
    const double dividends = taxableBalance * (params_.dividendYieldPct / 100.0);
    return capitalGainsTax(dividends, params_.filingStatus, 0.0, data_.tables);
}

double PathSimulator::inflationPctForYear(int year) const {
    const int shockStart = params_.yearsToRetirement();
    if (params_.inflationShockPct && year >= shockStart && year < shockStart + params_.inflationShockYears) {
        return *params_.inflationShockPct;
    }
    return params_.inflationPct;
}

PathResult PathSimulator::run(std::uint32_t seed) const {
    const TaxTables& tables = data_.tables;
    const HistoricalSeries& history = data_.history;
    const FilingStatus status = params_.filingStatus;
    const bool married = params_.married();
    const int yrsToRet = params_.yearsToRetirement();
    const int yrsToSim = params_.drawdownYears();
    const double inflFactor = 1.0 + params_.inflationPct / 100.0;

    // Drawdown playback continues where accumulation left off, wrapping
    // around the end of the series.
    const int seriesLength = static_cast<int>(history.size());
    const int drawdownStartYear =
        history.startYear() +
        ((params_.historicalStartYear - history.startYear() + yrsToRet) % seriesLength + seriesLength) % seriesLength;

    ReturnGenerator accumulationGen(
        generatorConfig(static_cast<std::size_t>(yrsToRet + 1), seed, params_.historicalStartYear, params_.youngerAge()),
        history);
    ReturnGenerator drawdownGen(generatorConfig(static_cast<std::size_t>(yrsToSim),
                                                seed + 1u,
                                                drawdownStartYear,
                                                params_.olderAge() + yrsToRet),
                                history);
    const Eigen::ArrayXd accumulationFactors = accumulationGen.materialize();
    const Eigen::ArrayXd drawdownFactors = drawdownGen.materialize();

    const std::vector<int> childAges = effectiveChildAges(params_.children, yrsToRet);

    PathResult result;
    result.trajectory.reserve(params_.trajectoryLength());

    AccountBalances accounts;
    accounts.taxable = params_.taxableBalance;
    accounts.pretax = params_.pretaxBalance;
    accounts.roth = params_.rothBalance;
    accounts.taxableBasis = params_.taxableBalance;
    double emergency = params_.emergencyFund;
    double cumulativeInflation = 1.0;

    auto record = [&](int year, double gross, double rmd, double socialSecurity) {
        if (year > 0) {
            cumulativeInflation *= 1.0 + inflationPctForYear(year) / 100.0;
        }
        YearlyState state;
        state.age = params_.age1 + year;
        state.nominal = accounts.total() + emergency;
        state.real = state.nominal / cumulativeInflation;
        state.cumulativeInflation = cumulativeInflation;
        state.accounts = accounts;
        state.grossWithdrawal = gross;
        state.requiredDistribution = rmd;
        state.socialSecurity = socialSecurity;
        result.trajectory.push_back(state);
    };

    Contributions contrib1 = params_.contributions1;
    Contributions contrib2 = params_.contributions2;
    const double contribGrowth = 1.0 + params_.contributionGrowthPct / 100.0;

    for (int y = 0; y <= yrsToRet; ++y) {
        const double g = accumulationFactors[y];
        const int a1 = params_.age1 + y;
        const int a2 = params_.age2 + y;

        if (y > 0) {
            accounts.taxable *= g;
            accounts.pretax *= g;
            accounts.roth *= g;
            accounts.taxable -= yieldDragTax(accounts.taxable);
            if (params_.increaseContributions) {
                contrib1 = contrib1.scaled(contribGrowth);
                contrib2 = contrib2.scaled(contribGrowth);
            }
        }

        const bool working1 = a1 < params_.retirementAge;
        if (working1) {
            deposit(accounts, contrib1, g);
        }
        if (married && a2 < params_.retirementAge) {
            deposit(accounts, contrib2, g);
        }

        if (working1 && !childAges.empty()) {
            const double childCost = childExpenses(childAges, y, std::pow(inflFactor, y));
            accounts.taxable = std::max(0.0, accounts.taxable - childCost);
        }

        if (working1 && params_.healthcare.includePreMedicare) {
            const double medicalFactor = std::pow(1.0 + params_.healthcare.medicalInflationPct / 100.0, y);
            const double premium =
                preMedicareHealthcareCost(a1, married ? std::optional<int>(a2) : std::nullopt,
                                          dependentChildCount(childAges, y), medicalFactor, tables);
            accounts.taxable = std::max(0.0, accounts.taxable - premium);
        }

        if (y > 0) {
            emergency *= inflFactor;
        }
        record(y, 0.0, 0.0, 0.0);
    }

    const double wdGrossY1 = (accounts.total() + emergency) * (params_.withdrawalPct / 100.0);
    WithdrawalRequest firstYear;
    firstYear.gross = wdGrossY1;
    firstYear.stateTaxPct = params_.stateTaxPct;
    const WithdrawalTaxes y1Taxes = computeWithdrawalTaxes(firstYear, accounts, status, tables);
    result.y1AfterTaxReal = (wdGrossY1 - y1Taxes.total) / std::pow(inflFactor, yrsToRet);

    double currWdGross = wdGrossY1;
    for (int y = 1; y <= yrsToSim; ++y) {
        const double g = drawdownFactors[y - 1];
        accounts.taxable *= g;
        accounts.pretax *= g;
        accounts.roth *= g;
        emergency *= inflFactor;
        accounts.taxable -= yieldDragTax(accounts.taxable);

        const int year = yrsToRet + y;
        const int age = params_.age1 + year;
        const int age2 = params_.age2 + year;
        const double rmd = requiredMinimumDistribution(accounts.pretax, age, tables);
        const double socialSecurity = householdSocialSecurity(age, age2);

        if (params_.rothConversion.enabled && age < tables.rmdStartAge && accounts.pretax > 0.0 &&
            accounts.taxable > 0.0) {
            const std::optional<double> ceiling =
                bracketIncomeCeiling(params_.rothConversion.targetBracketRate, status, tables);
            const double headroom = ceiling ? std::max(0.0, *ceiling - socialSecurity) : 0.0;
            if (headroom > 0.0) {
                const double maxConversion = std::min(headroom, accounts.pretax);
                const double baseTax = ordinaryIncomeTax(socialSecurity, status, tables);
                const double fullTax = ordinaryIncomeTax(socialSecurity + maxConversion, status, tables) - baseTax;
                const double affordable =
                    fullTax > 0.0 ? std::min(maxConversion, accounts.taxable / fullTax * maxConversion) : maxConversion;
                if (affordable > 0.0) {
                    const double conversion = std::min(affordable, accounts.pretax);
                    const double conversionTax =
                        ordinaryIncomeTax(socialSecurity + conversion, status, tables) - baseTax;
                    accounts.pretax -= conversion;
                    accounts.roth += conversion;
                    accounts.taxable -= conversionTax;
                    result.totalRothConversions += conversion;
                    result.conversionTaxesPaid += conversionTax;
                }
            }
        }

        const double healthcare =
            retirementHealthcareCost(params_.healthcare, age, y, currWdGross + socialSecurity + rmd, status, tables)
                .total();
        const double childCost =
            childAges.empty() ? 0.0 : childExpenses(childAges, year, std::pow(inflFactor, year));

        const double need = std::max(0.0, currWdGross + healthcare + childCost - socialSecurity);
        double withdrawal = need;
        double rmdExcess = 0.0;
        if (rmd > need) {
            withdrawal = rmd;
            rmdExcess = rmd - need;
        }

        WithdrawalRequest request;
        request.gross = withdrawal;
        request.minPretaxDraw = rmd;
        request.baseOrdinaryIncome = socialSecurity;
        request.stateTaxPct = params_.stateTaxPct;
        const WithdrawalTaxes taxes = computeWithdrawalTaxes(request, accounts, status, tables);
        accounts.taxable -= taxes.draw.taxable;
        accounts.pretax -= taxes.draw.pretax;
        accounts.roth -= taxes.draw.roth;
        accounts.taxableBasis = taxes.newBasis;

        // Forced distribution beyond the need is taxed once, then reinvested.
        if (rmdExcess > 0.0) {
            const double reinvested = rmdExcess - ordinaryIncomeTax(rmdExcess, status, tables);
            accounts.taxable += reinvested;
            accounts.taxableBasis += reinvested;
        }

        accounts.clampNonNegative();
        record(year, withdrawal, rmd, socialSecurity);

        const double portfolio = accounts.total();
        if (portfolio <= 0.0 && emergency <= 0.0) {
            if (!result.ruined) {
                result.survivalYears = y - 1;
                result.ruined = true;
            }
            accounts = AccountBalances{};
            emergency = 0.0;
        } else if (portfolio <= 0.0) {
            emergency -= std::min(currWdGross, emergency);
            accounts = AccountBalances{};
            result.survivalYears = y;
        } else {
            result.survivalYears = y;
        }

        currWdGross *= inflFactor;
    }

    result.eolReal = std::max(0.0, accounts.total() + emergency) / cumulativeInflation;
    return result;
}

}  // namespace retiresim
