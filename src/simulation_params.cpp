#include "simulation_params.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace retiresim {

int SimulationParams::youngerAge() const {
    return married() ? std::min(age1, age2) : age1;
}

int SimulationParams::olderAge() const {
    return married() ? std::max(age1, age2) : age1;
}

int SimulationParams::drawdownYears() const {
    return std::max(0, lifeExpectancy - (olderAge() + yearsToRetirement()));
}

std::size_t SimulationParams::trajectoryLength() const {
    return static_cast<std::size_t>(yearsToRetirement() + drawdownYears() + 1);
}

void SimulationParams::validate() const {
    if (retirementAge <= youngerAge()) {
        throw std::invalid_argument("Retirement age must be greater than current age");
    }
    if (age1 < 0 || (married() && age2 < 0)) {
        throw std::invalid_argument("SimulationParams ages must be non-negative");
    }
    if (lifeExpectancy <= retirementAge) {
        throw std::invalid_argument("SimulationParams.lifeExpectancy must exceed the retirement age");
    }
    if (taxableBalance < 0.0 || pretaxBalance < 0.0 || rothBalance < 0.0 || emergencyFund < 0.0) {
        throw std::invalid_argument("SimulationParams starting balances must be non-negative");
    }
    if (inflationPct <= -100.0 || returnPct <= -100.0) {
        throw std::invalid_argument("SimulationParams rates must exceed -100%");
    }
    if (withdrawalPct < 0.0) {
        throw std::invalid_argument("SimulationParams.withdrawalPct must be non-negative");
    }
    if (stateTaxPct < 0.0 || stateTaxPct > 100.0) {
        throw std::invalid_argument("SimulationParams.stateTaxPct must be in [0, 100]");
    }
    if (inflationShockYears < 0) {
        throw std::invalid_argument("SimulationParams.inflationShockYears must be non-negative");
    }
    if (healthcare.ltcProbabilityPct < 0.0 || healthcare.ltcProbabilityPct > 100.0) {
        throw std::invalid_argument("HealthcareParams.ltcProbabilityPct must be in [0, 100]");
    }
    if (children.count < 0 || children.additionalExpected < 0) {
        throw std::invalid_argument("ChildrenParams counts must be non-negative");
    }
}

void AccountBalances::clampNonNegative() {
    taxable = std::max(0.0, taxable);
    pretax = std::max(0.0, pretax);
    roth = std::max(0.0, roth);
    taxableBasis = std::max(0.0, taxableBasis);
}

}  // namespace retiresim
