#include "guardrails.hpp"

#include <catch2/catch.hpp>

#include <vector>

using namespace retiresim;

namespace {

std::vector<PathSummary> batchWithFailures() {
    std::vector<PathSummary> runs(10);
    runs[0].ruined = true;
    runs[0].survivalYears = 3;
    runs[1].ruined = true;
    runs[1].survivalYears = 12;
    return runs;
}

}  // namespace

TEST_CASE("prevention rate falls with survival time", "[guardrails]") {
    REQUIRE(preventionRate(0) == Approx(0.75));
    REQUIRE(preventionRate(10) == Approx(0.65));
    REQUIRE(preventionRate(30) == Approx(0.05));
    for (int years = 1; years <= 40; ++years) {
        REQUIRE(preventionRate(years) <= preventionRate(years - 1));
    }
}

TEST_CASE("guardrails estimate over a batch", "[guardrails]") {
    const GuardrailsResult result = estimateGuardrailsImpact(batchWithFailures(), 0.1);
    REQUIRE(result.totalFailures == 2);
    REQUIRE(result.preventableFailures == 1);
    REQUIRE(result.baselineSuccessRate == Approx(0.8));
    REQUIRE(result.newSuccessRate == Approx(0.92));
    REQUIRE(result.improvement == Approx(0.12));
}

TEST_CASE("smaller cuts recover proportionally less", "[guardrails]") {
    const GuardrailsResult half = estimateGuardrailsImpact(batchWithFailures(), 0.05);
    REQUIRE(half.newSuccessRate == Approx(0.86));

    const GuardrailsResult deep = estimateGuardrailsImpact(batchWithFailures(), 0.3);
    REQUIRE(deep.newSuccessRate == Approx(0.92));

    const GuardrailsResult none = estimateGuardrailsImpact(batchWithFailures(), 0.0);
    REQUIRE(none.improvement == Approx(0.0));
    REQUIRE(none.newSuccessRate <= 1.0);
}

TEST_CASE("a batch without failures needs no guardrails", "[guardrails]") {
    const GuardrailsResult result = estimateGuardrailsImpact(std::vector<PathSummary>(5), 0.1);
    REQUIRE(result.totalFailures == 0);
    REQUIRE(result.baselineSuccessRate == 1.0);
    REQUIRE(result.newSuccessRate == 1.0);
    REQUIRE(result.improvement == 0.0);
}

TEST_CASE("guardrails input is validated", "[guardrails]") {
    REQUIRE_THROWS_AS(estimateGuardrailsImpact({}, 0.1), std::invalid_argument);
    REQUIRE_THROWS_AS(estimateGuardrailsImpact(batchWithFailures(), -0.1), std::invalid_argument);
}
