#pragma once

#include "batch_runner.hpp"

#include <vector>

namespace retiresim {

struct GuardrailsResult {
    int totalFailures = 0;
    int preventableFailures = 0;
    double newSuccessRate = 1.0;
    double baselineSuccessRate = 1.0;
    double improvement = 0.0;
};

// Share of failures a dynamic spending cut would have prevented, by how many
// drawdown years the path survived.
[[nodiscard]] double preventionRate(int survivalYears);

// Heuristic estimate of a spending-reduction policy (decimal, 0.1 = 10%) over
// a completed batch. Does not re-run any path. Throws std::invalid_argument
// for an empty batch or a negative reduction.
[[nodiscard]] GuardrailsResult estimateGuardrailsImpact(const std::vector<PathSummary>& runs, double spendingReduction);

}  // namespace retiresim
