#pragma once

#include "tax_tables.hpp"

#include <vector>

namespace retiresim {

struct LegacyParams {
    FilingStatus filingStatus = FilingStatus::Single;  // selects the estate-tax exemption
    double eolNominal = 0.0;
    int yearsFromStart = 0;  // years between today and the estate start
    double nominalReturnPct = 7.0;
    double inflationPct = 2.6;
    double perBeneficiaryReal = 0.0;  // annual payout per eligible heir, today's dollars
    int startBeneficiaries = 1;
    double totalFertilityRate = 2.0;
    int generationLength = 30;
    int deathAge = 90;
    int minDistributionAge = 21;
    int capYears = 10000;
    std::vector<int> initialBeneficiaryAges{0};
    int fertilityWindowStart = 25;
    int fertilityWindowEnd = 35;
};

struct GenerationCheckpoint {
    int generation = 0;
    int year = 0;
    double estateValue = 0.0;  // nominal
    double estateTax = 0.0;
    double netToHeirs = 0.0;
    double fundRealValue = 0.0;
    double livingBeneficiaries = 0.0;
};

struct LegacyResult {
    bool perpetual = false;  // years is meaningless when set
    int years = 0;
    double fundLeftReal = 0.0;
    double lastLivingCount = 0.0;
    std::vector<GenerationCheckpoint> generations;
};

// Deterministic dynasty-fund model: a real-terms fund pays every living heir
// past the distribution age until it, or the family, runs out.
[[nodiscard]] LegacyResult simulateLegacy(const LegacyParams& params);

}  // namespace retiresim
