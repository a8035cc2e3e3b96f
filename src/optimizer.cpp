#include "optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace retiresim {

GoalSeeker::GoalSeeker(const EngineData& data, OptimizerConfig config) : runner_(data), config_(config) {
    if (config_.testRuns == 0) {
        throw std::invalid_argument("OptimizerConfig.testRuns must be positive");
    }
    if (config_.maxIterations <= 0) {
        throw std::invalid_argument("OptimizerConfig.maxIterations must be positive");
    }
    if (config_.successThreshold <= 0.0 || config_.successThreshold > 1.0) {
        throw std::invalid_argument("OptimizerConfig.successThreshold must be in (0, 1]");
    }
}

bool GoalSeeker::clearsThreshold(const SimulationParams& params,
                                 std::uint32_t baseSeed,
                                 const CancellationToken& token) const {
    token.throwIfCancelled();
    BatchConfig batch;
    batch.baseSeed = baseSeed;
    batch.paths = config_.testRuns;
    batch.progressInterval = config_.testRuns;
    const BatchResult result = runner_.run(params, batch, {}, token);
    return result.probRuin < 1.0 - config_.successThreshold;
}

double GoalSeeker::minimumContribution(const SimulationParams& params,
                                       std::uint32_t baseSeed,
                                       const CancellationToken& token) const {
    const double current = params.totalContributions();
    if (current <= 0.0) {
        return 0.0;
    }

    double low = 0.0;
    double high = current;
    double best = current;
    for (int iteration = 0; low < high && iteration < config_.maxIterations; ++iteration) {
        const double mid = low + (high - low) / 2.0;
        const double scale = mid / current;

        SimulationParams trial = params;
        trial.contributions1 = params.contributions1.scaled(scale);
        trial.contributions2 = params.contributions2.scaled(scale);
        if (clearsThreshold(trial, baseSeed, token)) {
            best = mid;
            high = mid;
        } else {
            low = mid;
        }
        if (std::abs(high - low) < config_.contributionTolerance) break;
    }
    return best;
}

double GoalSeeker::maximumSplurge(const SimulationParams& params,
                                  std::uint32_t baseSeed,
                                  const CancellationToken& token) const {
    const double liquid = params.taxableBalance;
    if (liquid <= 0.0) {
        return 0.0;
    }

    double low = 0.0;
    double high = std::min(config_.splurgeCap, liquid * config_.splurgeLiquidFraction);
    double best = 0.0;
    for (int iteration = 0; low < high && iteration < config_.maxIterations; ++iteration) {
        const double mid = low + (high - low) / 2.0;

        SimulationParams trial = params;
        trial.taxableBalance = std::max(0.0, liquid - mid);
        if (clearsThreshold(trial, baseSeed, token)) {
            best = mid;
            low = mid;
        } else {
            high = mid;
        }
        if (high - low < config_.splurgeTolerance) break;
    }
    return best;
}

int GoalSeeker::earliestRetirementAge(const SimulationParams& params,
                                      std::uint32_t baseSeed,
                                      const CancellationToken& token) const {
    int minAge = params.youngerAge() + 1;
    int maxAge = params.retirementAge;
    int best = params.retirementAge;
    for (int iteration = 0; minAge <= maxAge && iteration < config_.maxIterations; ++iteration) {
        const int mid = minAge + (maxAge - minAge) / 2;

        SimulationParams trial = params;
        trial.retirementAge = mid;
        if (clearsThreshold(trial, baseSeed, token)) {
            best = mid;
            maxAge = mid - 1;
        } else {
            minAge = mid + 1;
        }
    }
    return best;
}

OptimizationResult GoalSeeker::solve(const SimulationParams& params,
                                     std::uint32_t baseSeed,
                                     const CancellationToken& token) const {
    params.validate();

    OptimizationResult result;
    result.minimumContribution = minimumContribution(params, baseSeed, token);
    result.surplusAnnual = std::max(0.0, params.totalContributions() - result.minimumContribution);
    result.surplusMonthly = result.surplusAnnual / 12.0;
    result.maxSplurge = std::max(0.0, maximumSplurge(params, baseSeed, token));
    result.earliestRetirementAge = earliestRetirementAge(params, baseSeed, token);
    result.yearsEarlier = std::max(0, params.retirementAge - result.earliestRetirementAge);
    return result;
}

}  // namespace retiresim
