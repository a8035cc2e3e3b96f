#pragma once

#include "batch_runner.hpp"
#include "engine_data.hpp"
#include "simulation_params.hpp"

#include <cstddef>
#include <cstdint>

namespace retiresim {

struct OptimizerConfig {
    double successThreshold = 0.95;
    std::size_t testRuns = 400;  // reduced batch size per oracle call
    int maxIterations = 50;      // safety brake for every search
    double contributionTolerance = 100.0;
    double splurgeTolerance = 1000.0;
    double splurgeCap = 5000000.0;
    double splurgeLiquidFraction = 0.95;
};

struct OptimizationResult {
    double minimumContribution = 0.0;
    double surplusAnnual = 0.0;
    double surplusMonthly = 0.0;
    double maxSplurge = 0.0;
    int earliestRetirementAge = 0;
    int yearsEarlier = 0;
};

// Binary searches over a "ruin probability below 1 - threshold" oracle. On
// hitting the iteration cap each search returns its best candidate so far.
class GoalSeeker {
public:
    GoalSeeker(const EngineData& data, OptimizerConfig config = {});

    [[nodiscard]] bool clearsThreshold(const SimulationParams& params,
                                       std::uint32_t baseSeed,
                                       const CancellationToken& token = CancellationToken()) const;

    // Smallest total annual contribution (all line items scaled together)
    // that still clears the threshold.
    [[nodiscard]] double minimumContribution(const SimulationParams& params,
                                             std::uint32_t baseSeed,
                                             const CancellationToken& token = CancellationToken()) const;

    // Largest one-time draw from the taxable balance that still clears.
    [[nodiscard]] double maximumSplurge(const SimulationParams& params,
                                        std::uint32_t baseSeed,
                                        const CancellationToken& token = CancellationToken()) const;

    // Smallest integer retirement age in [youngerAge + 1, retirementAge] that
    // clears; retirementAge itself when none does.
    [[nodiscard]] int earliestRetirementAge(const SimulationParams& params,
                                            std::uint32_t baseSeed,
                                            const CancellationToken& token = CancellationToken()) const;

    [[nodiscard]] OptimizationResult solve(const SimulationParams& params,
                                           std::uint32_t baseSeed,
                                           const CancellationToken& token = CancellationToken()) const;

    [[nodiscard]] const OptimizerConfig& config() const noexcept { return config_; }

private:
    BatchRunner runner_;
    OptimizerConfig config_;
};

}  // namespace retiresim
