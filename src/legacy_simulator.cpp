#include "legacy_simulator.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace retiresim {

namespace {

constexpr int kChunkYears = 10;
constexpr int kEarlyTerminationYear = 1000;
constexpr int kUncappedHorizon = 10000;
constexpr double kEarlyTerminationGrowth = 0.03;
constexpr double kPerpetualSafetyMargin = 0.95;
constexpr double kEstateExemptionSingle = 13610000.0;
constexpr double kEstateExemptionMarried = 27220000.0;
constexpr double kEstateExemptionGrowth = 0.026;
constexpr double kEstateTaxRate = 0.40;
constexpr std::size_t kMaxCheckpoints = 10;

struct Cohort {
    double size = 0.0;
    int age = 0;
    bool canReproduce = true;
    double cumulativeBirths = 0.0;
};

// Exemption in force yearsOut years after the base year; married couples
// carry the portable double exemption.
double estateExemption(FilingStatus status, int yearsOut) {
    const double base = status == FilingStatus::Married ? kEstateExemptionMarried : kEstateExemptionSingle;
    return yearsOut > 0 ? base * std::pow(1.0 + kEstateExemptionGrowth, yearsOut) : base;
}

double livingCount(const std::vector<Cohort>& cohorts) {
    return std::accumulate(cohorts.begin(), cohorts.end(), 0.0,
                           [](double sum, const Cohort& c) { return sum + c.size; });
}

struct ChunkOutcome {
    int years = 0;
    bool depleted = false;
};

class DynastyState {
public:
    DynastyState(const LegacyParams& params, double fundReal, double realReturn)
        : params_(params), fundReal_(fundReal), realReturn_(realReturn) {
        const int window = params_.fertilityWindowEnd - params_.fertilityWindowStart;
        birthsPerYear_ = window > 0 ? params_.totalFertilityRate / window : 0.0;

        if (!params_.initialBeneficiaryAges.empty()) {
            for (int age : params_.initialBeneficiaryAges) {
                cohorts_.push_back({1.0, age, age <= params_.fertilityWindowEnd, 0.0});
            }
        } else if (params_.startBeneficiaries > 0) {
            cohorts_.push_back({static_cast<double>(params_.startBeneficiaries), 0, true, 0.0});
        }
    }

    ChunkOutcome advance(int years) {
        ChunkOutcome outcome;
        for (int i = 0; i < years; ++i) {
            cohorts_.erase(std::remove_if(cohorts_.begin(), cohorts_.end(),
                                          [this](const Cohort& c) { return c.age >= params_.deathAge; }),
                           cohorts_.end());
            if (livingCount(cohorts_) <= 0.0) {
                outcome.depleted = true;
                return outcome;
            }

            fundReal_ *= 1.0 + realReturn_;
            double eligible = 0.0;
            for (const auto& c : cohorts_) {
                if (c.age >= params_.minDistributionAge) eligible += c.size;
            }
            fundReal_ -= params_.perBeneficiaryReal * eligible;
            if (fundReal_ < 0.0) {
                fundReal_ = 0.0;
                outcome.depleted = true;
                return outcome;
            }
            ++outcome.years;

            // All of a year's births share one cohort, so at most deathAge
            // cohorts are alive at once.
            double newborns = 0.0;
            for (auto& c : cohorts_) {
                ++c.age;
                if (c.canReproduce && c.age >= params_.fertilityWindowStart && c.age <= params_.fertilityWindowEnd &&
                    c.cumulativeBirths < params_.totalFertilityRate) {
                    const double births = std::min(birthsPerYear_, params_.totalFertilityRate - c.cumulativeBirths);
                    newborns += c.size * births;
                    c.cumulativeBirths += births;
                }
            }
            if (newborns > 0.0) {
                cohorts_.push_back({newborns, 0, true, 0.0});
            }
        }
        return outcome;
    }

    [[nodiscard]] double fundReal() const { return fundReal_; }
    [[nodiscard]] double living() const { return livingCount(cohorts_); }

private:
    const LegacyParams& params_;
    double fundReal_;
    double realReturn_;
    double birthsPerYear_ = 0.0;
    std::vector<Cohort> cohorts_;
};

}  // namespace

LegacyResult simulateLegacy(const LegacyParams& params) {
    if (params.capYears < 0) {
        throw std::invalid_argument("LegacyParams.capYears must be non-negative");
    }
    if (params.generationLength <= 0) {
        throw std::invalid_argument("LegacyParams.generationLength must be positive");
    }
    if (params.inflationPct <= -100.0 || params.nominalReturnPct <= -100.0) {
        throw std::invalid_argument("LegacyParams rates must exceed -100%");
    }

    const double inflFactor = 1.0 + params.inflationPct / 100.0;
    const double realReturn = (1.0 + params.nominalReturnPct / 100.0) / inflFactor - 1.0;
    const double startFund = params.eolNominal / std::pow(inflFactor, params.yearsFromStart);

    LegacyResult result;

    // Closed-form shortcut: payouts below the sustainable real rate, net of
    // population growth, never exhaust an uncapped fund.
    if (startFund > 0.0 && params.capYears >= kUncappedHorizon) {
        const double populationGrowth = (params.totalFertilityRate - 2.0) / params.generationLength;
        const double distributionRate = params.perBeneficiaryReal * params.startBeneficiaries / startFund;
        if (distributionRate < kPerpetualSafetyMargin * (realReturn - populationGrowth)) {
            result.perpetual = true;
            result.fundLeftReal = startFund;
            result.lastLivingCount = params.startBeneficiaries;
            return result;
        }
    }

    DynastyState state(params, startFund, realReturn);
    int nextCheckpoint = params.generationLength;
    int generation = 1;
    double fundAtYear100 = 0.0;
    double fundAtYear1000 = 0.0;

    for (int t = 0; t < params.capYears; t += kChunkYears) {
        const ChunkOutcome chunk = state.advance(std::min(kChunkYears, params.capYears - t));
        result.years += chunk.years;
        if (chunk.depleted) {
            result.fundLeftReal = 0.0;
            result.lastLivingCount = state.living();
            return result;
        }

        if (t >= nextCheckpoint && result.generations.size() < kMaxCheckpoints) {
            GenerationCheckpoint checkpoint;
            checkpoint.generation = generation++;
            checkpoint.year = t;
            checkpoint.estateValue = state.fundReal() * std::pow(inflFactor, params.yearsFromStart + t);
            const double exemption = estateExemption(params.filingStatus, params.yearsFromStart + t);
            checkpoint.estateTax = std::max(0.0, checkpoint.estateValue - exemption) * kEstateTaxRate;
            checkpoint.netToHeirs = checkpoint.estateValue - checkpoint.estateTax;
            checkpoint.fundRealValue = state.fundReal();
            checkpoint.livingBeneficiaries = state.living();
            result.generations.push_back(checkpoint);
            nextCheckpoint += params.generationLength;
        }

        if (t == 100 && fundAtYear100 == 0.0) fundAtYear100 = state.fundReal();
        if (t == kEarlyTerminationYear && fundAtYear1000 == 0.0) fundAtYear1000 = state.fundReal();

        // A fund still compounding fast after a millennium is treated as
        // perpetual.
        if (t > kEarlyTerminationYear && params.capYears >= kUncappedHorizon && fundAtYear100 > 0.0 &&
            fundAtYear1000 > 0.0 && state.fundReal() > fundAtYear1000) {
            const double growth =
                std::pow(state.fundReal() / fundAtYear1000, 1.0 / (t - kEarlyTerminationYear)) - 1.0;
            if (growth > kEarlyTerminationGrowth) {
                result.perpetual = true;
                result.fundLeftReal = state.fundReal();
                result.lastLivingCount = state.living();
                return result;
            }
        }
    }

    result.fundLeftReal = state.fundReal();
    result.lastLivingCount = state.living();
    return result;
}

}  // namespace retiresim
