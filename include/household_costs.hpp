#pragma once

#include "simulation_params.hpp"
#include "tax_tables.hpp"

#include <optional>
#include <vector>

namespace retiresim {

// Child ages at simulation year 0. Explicit ages win; otherwise `count`
// children aged 5, 8, 11, ... Expected children are appended with negative
// ages, one born every other year of the working horizon.
[[nodiscard]] std::vector<int> effectiveChildAges(const ChildrenParams& children, int yearsToRetirement);

// Annual childcare, schooling, college and dependent cost for all children in
// the given simulation year. Unborn children and those past college cost
// nothing.
[[nodiscard]] double childExpenses(const std::vector<int>& startAges, int year, double inflationFactor);

// Children aged 0..25 in the given year, covered by a parent's plan.
[[nodiscard]] int dependentChildCount(const std::vector<int>& startAges, int year);

// Individual-market premium before Medicare eligibility; zero from the
// eligibility age on.
[[nodiscard]] double preMedicarePremium(int age, const TaxTables& tables);

[[nodiscard]] double preMedicareHealthcareCost(int age1,
                                               std::optional<int> age2,
                                               int dependentChildren,
                                               double medicalInflationFactor,
                                               const TaxTables& tables);

struct RetirementHealthcareCost {
    double medicare = 0.0;
    double irmaa = 0.0;
    double longTermCare = 0.0;

    [[nodiscard]] double total() const { return medicare + irmaa + longTermCare; }
};

// Medicare premium and IRMAA surcharge from the eligibility age, plus the
// probability-weighted long-term-care cost inside its onset window.
[[nodiscard]] RetirementHealthcareCost retirementHealthcareCost(const HealthcareParams& healthcare,
                                                                int age,
                                                                int drawdownYear,
                                                                double estimatedMagi,
                                                                FilingStatus status,
                                                                const TaxTables& tables);

}  // namespace retiresim
