#pragma once

#include "market_data.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace retiresim {

enum class ReturnMode { Fixed, Bootstrap, Historical };
enum class ReturnSeries { Nominal, Real };

enum class GlidePathStrategy { None, Aggressive, AgeBased, Custom };
enum class GlidePathShape { Linear, Accelerated, Decelerated };

struct BondGlidePath {
    GlidePathStrategy strategy = GlidePathStrategy::None;
    int startAge = 50;
    int endAge = 70;
    double startPct = 10.0;
    double endPct = 60.0;
    GlidePathShape shape = GlidePathShape::Linear;
};

constexpr double kBondNominalAvgPct = 4.5;
constexpr double kReturnClampPct = 15.0;

// Percent of the portfolio held in bonds at the given age.
[[nodiscard]] double bondAllocationPct(int age, const BondGlidePath& glidePath);

// Bond return implied by a sampled equity return, in percent.
[[nodiscard]] double bondReturnPct(double stockReturnPct);

struct ReturnGeneratorConfig {
    ReturnMode mode = ReturnMode::Fixed;
    std::size_t years = 0;
    double nominalPct = 9.8;
    double inflationPct = 2.6;
    ReturnSeries series = ReturnSeries::Nominal;
    std::uint32_t seed = 12345;
    int startYear = 1928;  // Historical mode only
    int currentAge = 35;   // first year's age, for the glide path
    BondGlidePath glidePath;
};

// Finite sequence of annual growth factors (1 + rate). Restartable only by
// constructing a new generator with the same config.
class ReturnGenerator {
public:
    ReturnGenerator(const ReturnGeneratorConfig& config, const HistoricalSeries& history);

    [[nodiscard]] bool hasNext() const noexcept { return produced_ < config_.years; }
    [[nodiscard]] std::size_t remaining() const noexcept { return config_.years - produced_; }

    // Throws std::out_of_range once the horizon is exhausted.
    double next();

    // Drains the remaining factors into a dense array.
    [[nodiscard]] Eigen::ArrayXd materialize();

private:
    double blend(double stockPct) const;

    ReturnGeneratorConfig config_;
    std::vector<double> data_;
    std::size_t startIndex_ = 0;
    std::size_t produced_ = 0;
    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::size_t> pick_;
};

}  // namespace retiresim
