#include "tax_tables.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace retiresim {

namespace {

constexpr double kUnbounded = std::numeric_limits<double>::infinity();

void validateBrackets(const std::vector<TaxBracket>& brackets, const std::string& name) {
    if (brackets.empty()) {
        throw std::invalid_argument("TaxTables." + name + " must not be empty");
    }
    double previous = 0.0;
    for (const auto& bracket : brackets) {
        if (bracket.limit <= previous) {
            throw std::invalid_argument("TaxTables." + name + " limits must be strictly increasing");
        }
        if (bracket.rate < 0.0 || bracket.rate >= 1.0) {
            throw std::invalid_argument("TaxTables." + name + " rates must be in [0, 1)");
        }
        previous = bracket.limit;
    }
}

void validateIrmaa(const std::vector<IrmaaTier>& tiers, const std::string& name) {
    if (tiers.empty()) {
        throw std::invalid_argument("TaxTables." + name + " must not be empty");
    }
    double previous = -1.0;
    for (const auto& tier : tiers) {
        if (tier.magiThreshold <= previous) {
            throw std::invalid_argument("TaxTables." + name + " thresholds must be strictly increasing");
        }
        previous = tier.magiThreshold;
    }
}

}  // namespace

TaxTables TaxTables::us2026() {
    TaxTables tables;

    tables.ordinarySingle.standardDeduction = 16100.0;
    tables.ordinarySingle.brackets = {
        {12400.0, 0.10}, {50400.0, 0.12}, {105700.0, 0.22}, {201775.0, 0.24},
        {256225.0, 0.32}, {640600.0, 0.35}, {kUnbounded, 0.37},
    };

    tables.ordinaryMarried.standardDeduction = 32200.0;
    tables.ordinaryMarried.brackets = {
        {24800.0, 0.10}, {100800.0, 0.12}, {211400.0, 0.22}, {403550.0, 0.24},
        {512450.0, 0.32}, {768700.0, 0.35}, {kUnbounded, 0.37},
    };

    tables.capitalGainsSingle = {{49450.0, 0.0}, {545500.0, 0.15}, {kUnbounded, 0.20}};
    tables.capitalGainsMarried = {{98900.0, 0.0}, {613700.0, 0.15}, {kUnbounded, 0.20}};

    tables.rmdDivisors = {
        {73, 26.5}, {74, 25.5}, {75, 24.6}, {76, 23.7}, {77, 22.9}, {78, 22.0},
        {79, 21.1}, {80, 20.2}, {81, 19.4}, {82, 18.5}, {83, 17.7}, {84, 16.8},
        {85, 16.0}, {86, 15.2}, {87, 14.4}, {88, 13.7}, {89, 12.9}, {90, 12.2},
        {91, 11.5}, {92, 10.8}, {93, 10.1}, {94, 9.5},  {95, 8.9},  {96, 8.4},
        {97, 7.8},  {98, 7.3},  {99, 6.8},  {100, 6.4}, {101, 6.0}, {102, 5.6},
        {103, 5.2}, {104, 4.9}, {105, 4.6}, {106, 4.3}, {107, 4.1}, {108, 3.9},
        {109, 3.7}, {110, 3.5}, {111, 3.4}, {112, 3.3}, {113, 3.1}, {114, 3.0},
        {115, 2.9}, {116, 2.8}, {117, 2.7}, {118, 2.5}, {119, 2.3}, {120, 2.0},
    };

    tables.irmaaSingle = {
        {109000.0, 0.0}, {137000.0, 81.2}, {171000.0, 202.9},
        {205000.0, 324.6}, {500000.0, 446.3}, {kUnbounded, 487.0},
    };
    tables.irmaaMarried = {
        {218000.0, 0.0}, {274000.0, 81.2}, {342000.0, 202.9},
        {410000.0, 324.6}, {750000.0, 446.3}, {kUnbounded, 487.0},
    };

    return tables;
}

const BracketSchedule& TaxTables::ordinary(FilingStatus status) const {
    return status == FilingStatus::Married ? ordinaryMarried : ordinarySingle;
}

const std::vector<TaxBracket>& TaxTables::capitalGains(FilingStatus status) const {
    return status == FilingStatus::Married ? capitalGainsMarried : capitalGainsSingle;
}

const std::vector<IrmaaTier>& TaxTables::irmaa(FilingStatus status) const {
    return status == FilingStatus::Married ? irmaaMarried : irmaaSingle;
}

double TaxTables::niitThreshold(FilingStatus status) const {
    return status == FilingStatus::Married ? niitThresholdMarried : niitThresholdSingle;
}

double TaxTables::rmdDivisor(int age) const {
    const auto it = rmdDivisors.find(age);
    if (it == rmdDivisors.end()) {
        return rmdFallbackDivisor;
    }
    return it->second;
}

void TaxTables::validate() const {
    validateBrackets(ordinarySingle.brackets, "ordinarySingle");
    validateBrackets(ordinaryMarried.brackets, "ordinaryMarried");
    validateBrackets(capitalGainsSingle, "capitalGainsSingle");
    validateBrackets(capitalGainsMarried, "capitalGainsMarried");
    validateIrmaa(irmaaSingle, "irmaaSingle");
    validateIrmaa(irmaaMarried, "irmaaMarried");

    if (ordinarySingle.standardDeduction < 0.0 || ordinaryMarried.standardDeduction < 0.0) {
        throw std::invalid_argument("TaxTables standard deductions must be non-negative");
    }
    if (rmdDivisors.empty()) {
        throw std::invalid_argument("TaxTables.rmdDivisors must not be empty");
    }
    if (rmdFallbackDivisor <= 0.0) {
        throw std::invalid_argument("TaxTables.rmdFallbackDivisor must be positive");
    }
    double previous = std::numeric_limits<double>::infinity();
    for (const auto& [age, divisor] : rmdDivisors) {
        if (divisor <= 0.0 || divisor > previous) {
            throw std::invalid_argument("TaxTables.rmdDivisors must be positive and non-increasing (age " +
                                        std::to_string(age) + ")");
        }
        previous = divisor;
    }

    const SocialSecurityRules& ss = socialSecurity;
    if (ss.firstBendPoint <= 0.0 || ss.secondBendPoint <= ss.firstBendPoint) {
        throw std::invalid_argument("TaxTables.socialSecurity bend points must be increasing");
    }
}

}  // namespace retiresim
