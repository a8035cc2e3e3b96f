#include "household_costs.hpp"

#include "tax_model.hpp"

#include <algorithm>
#include <cmath>

namespace retiresim {

namespace {

constexpr double kChildcareAnnual = 15000.0;
constexpr double kK12Annual = 3000.0;
constexpr double kCollegeAnnual = 25000.0;
constexpr double kDependentBaseAnnual = 8000.0;
constexpr int kChildcareEndAge = 6;
constexpr int kK12EndAge = 18;
constexpr int kCollegeEndAge = 22;
constexpr int kDependentEndAge = 18;
constexpr int kCoveredChildEndAge = 26;

constexpr double kPerChildPremium = 3000.0;

double dependentAgeFactor(int age) {
    if (age < 6) return 1.0;
    if (age < 13) return 0.85;
    return 0.7;
}

}  // namespace

std::vector<int> effectiveChildAges(const ChildrenParams& children, int yearsToRetirement) {
    std::vector<int> ages = children.ages;
    if (ages.empty()) {
        for (int i = 0; i < children.count; ++i) {
            ages.push_back(5 + 3 * i);
        }
    }

    for (int k = 0; k < children.additionalExpected; ++k) {
        const int birthYear = 2 * (k + 1);
        if (birthYear > yearsToRetirement) break;
        ages.push_back(-birthYear);
    }
    return ages;
}

double childExpenses(const std::vector<int>& startAges, int year, double inflationFactor) {
    double total = 0.0;
    for (int startAge : startAges) {
        const int age = startAge + year;
        if (age < 0 || age >= kCollegeEndAge) continue;

        double cost = 0.0;
        if (age < kChildcareEndAge) {
            cost += kChildcareAnnual;
        } else if (age < kK12EndAge) {
            cost += kK12Annual;
        } else {
            cost += kCollegeAnnual;
        }

        if (age < kDependentEndAge) {
            cost += kDependentBaseAnnual * dependentAgeFactor(age);
        } else {
            cost += kDependentBaseAnnual * 0.5;
        }
        total += cost;
    }
    return total * inflationFactor;
}

int dependentChildCount(const std::vector<int>& startAges, int year) {
    return static_cast<int>(std::count_if(startAges.begin(), startAges.end(), [year](int startAge) {
        const int age = startAge + year;
        return age >= 0 && age < kCoveredChildEndAge;
    }));
}

double preMedicarePremium(int age, const TaxTables& tables) {
    if (age >= tables.medicareEligibilityAge) return 0.0;
    if (age < 30) return 4800.0;
    if (age < 40) return 6000.0;
    if (age < 50) return 8400.0;
    if (age < 55) return 10800.0;
    if (age < 60) return 13200.0;
    return 15600.0;
}

double preMedicareHealthcareCost(int age1,
                                 std::optional<int> age2,
                                 int dependentChildren,
                                 double medicalInflationFactor,
                                 const TaxTables& tables) {
    double cost = preMedicarePremium(age1, tables);
    bool anyAdultCovered = age1 < tables.medicareEligibilityAge;
    if (age2) {
        cost += preMedicarePremium(*age2, tables);
        anyAdultCovered = anyAdultCovered || *age2 < tables.medicareEligibilityAge;
    }
    if (dependentChildren > 0 && anyAdultCovered) {
        cost += dependentChildren * kPerChildPremium;
    }
    return cost * medicalInflationFactor;
}

RetirementHealthcareCost retirementHealthcareCost(const HealthcareParams& healthcare,
                                                  int age,
                                                  int drawdownYear,
                                                  double estimatedMagi,
                                                  FilingStatus status,
                                                  const TaxTables& tables) {
    RetirementHealthcareCost cost;
    const double medicalInflation = std::pow(1.0 + healthcare.medicalInflationPct / 100.0, drawdownYear);

    if (healthcare.includeMedicare && age >= tables.medicareEligibilityAge) {
        cost.medicare = healthcare.medicarePremiumMonthly * 12.0 * medicalInflation;
        cost.irmaa = irmaaMonthlySurcharge(estimatedMagi, status, tables) * 12.0 * medicalInflation;
    }

    if (healthcare.includeLongTermCare && age >= healthcare.ltcOnsetAge &&
        static_cast<double>(age - healthcare.ltcOnsetAge) < healthcare.ltcDurationYears) {
        cost.longTermCare = healthcare.ltcAnnualCost * (healthcare.ltcProbabilityPct / 100.0) * medicalInflation;
    }
    return cost;
}

}  // namespace retiresim
