#pragma once

#include <map>
#include <vector>

namespace retiresim {

enum class FilingStatus { Single, Married };

// A bracket taxes income between the previous bracket's limit and its own.
struct TaxBracket {
    double limit = 0.0;
    double rate = 0.0;
};

struct BracketSchedule {
    double standardDeduction = 0.0;
    std::vector<TaxBracket> brackets;
};

struct IrmaaTier {
    double magiThreshold = 0.0;
    double monthlySurcharge = 0.0;
};

struct SocialSecurityRules {
    double firstBendPoint = 1286.0;
    double secondBendPoint = 7749.0;
    double firstReplacementRate = 0.90;
    double secondReplacementRate = 0.32;
    double thirdReplacementRate = 0.15;
    double fullRetirementAge = 67.0;
    double earlyReductionPerMonth = 5.0 / 9.0 / 100.0;
    double extendedReductionPerMonth = 5.0 / 12.0 / 100.0;
    double delayedCreditPerMonth = 2.0 / 3.0 / 100.0;
    double reducedMonthsTier = 36.0;
    double spousalShare = 0.5;
    double spousalReductionPerMonth = 25.0 / 36.0 / 100.0;
};

// Point-in-time jurisdiction tables. Built once and passed by const reference
// to every tax and benefit function.
struct TaxTables {
    BracketSchedule ordinarySingle;
    BracketSchedule ordinaryMarried;
    std::vector<TaxBracket> capitalGainsSingle;
    std::vector<TaxBracket> capitalGainsMarried;
    double niitThresholdSingle = 200000.0;
    double niitThresholdMarried = 250000.0;
    double niitRate = 0.038;
    int rmdStartAge = 73;
    double rmdFallbackDivisor = 2.0;
    std::map<int, double> rmdDivisors;
    SocialSecurityRules socialSecurity;
    std::vector<IrmaaTier> irmaaSingle;
    std::vector<IrmaaTier> irmaaMarried;
    int medicareEligibilityAge = 65;

    [[nodiscard]] static TaxTables us2026();

    [[nodiscard]] const BracketSchedule& ordinary(FilingStatus status) const;
    [[nodiscard]] const std::vector<TaxBracket>& capitalGains(FilingStatus status) const;
    [[nodiscard]] const std::vector<IrmaaTier>& irmaa(FilingStatus status) const;
    [[nodiscard]] double niitThreshold(FilingStatus status) const;
    [[nodiscard]] double rmdDivisor(int age) const;

    // Throws std::invalid_argument when a table is empty or out of order.
    void validate() const;
};

}  // namespace retiresim
