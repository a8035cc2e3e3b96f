#pragma once

#include "engine_data.hpp"
#include "simulation_params.hpp"

#include <cstdint>

namespace retiresim {

// Advances one household through accumulation and drawdown. Each run owns its
// balances and return draws, so a single simulator may be shared by threads.
class PathSimulator {
public:
    // Throws std::invalid_argument when params fail validation.
    PathSimulator(SimulationParams params, const EngineData& data);

    [[nodiscard]] PathResult run(std::uint32_t seed) const;

    [[nodiscard]] const SimulationParams& params() const noexcept { return params_; }

private:
    [[nodiscard]] ReturnGeneratorConfig generatorConfig(std::size_t years,
                                                        std::uint32_t seed,
                                                        int startYear,
                                                        int currentAge) const;
    [[nodiscard]] double householdSocialSecurity(int age1, int age2) const;
    [[nodiscard]] double yieldDragTax(double taxableBalance) const;
    [[nodiscard]] double inflationPctForYear(int year) const;

    SimulationParams params_;
    const EngineData& data_;
};

}  // namespace retiresim
