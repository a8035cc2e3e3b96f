#include "guardrails.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace retiresim {

namespace {

constexpr double kReferenceReduction = 0.1;

}  // namespace

double preventionRate(int survivalYears) {
    if (survivalYears <= 5) return 0.75;
    if (survivalYears <= 10) return 0.65;
    if (survivalYears <= 15) return 0.45;
    if (survivalYears <= 20) return 0.30;
    if (survivalYears <= 25) return 0.15;
    return 0.05;
}

GuardrailsResult estimateGuardrailsImpact(const std::vector<PathSummary>& runs, double spendingReduction) {
    if (runs.empty()) {
        throw std::invalid_argument("Guardrails estimate requires at least one path");
    }
    if (spendingReduction < 0.0) {
        throw std::invalid_argument("spendingReduction must be non-negative");
    }

    GuardrailsResult result;
    const double scale = std::min(1.0, spendingReduction / kReferenceReduction);
    double recovered = 0.0;
    for (const auto& run : runs) {
        if (!run.ruined) continue;
        ++result.totalFailures;
        recovered += preventionRate(run.survivalYears) * scale;
    }
    if (result.totalFailures == 0) {
        return result;
    }

    const auto total = static_cast<double>(runs.size());
    const double successes = total - static_cast<double>(result.totalFailures);
    result.preventableFailures = static_cast<int>(std::lround(recovered));
    result.baselineSuccessRate = successes / total;
    result.newSuccessRate = (successes + recovered) / total;
    result.improvement = result.newSuccessRate - result.baselineSuccessRate;
    return result;
}

}  // namespace retiresim
