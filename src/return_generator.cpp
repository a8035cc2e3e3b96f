#include "return_generator.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace retiresim {

namespace {

constexpr double kBondEquityBaselinePct = 9.8;
constexpr double kBondEquitySensitivity = 0.3;

}  // namespace

double bondAllocationPct(int age, const BondGlidePath& glidePath) {
    switch (glidePath.strategy) {
        case GlidePathStrategy::None:
        case GlidePathStrategy::Aggressive:
            return 0.0;
        case GlidePathStrategy::AgeBased:
            if (age < 40) return 10.0;
            if (age <= 60) {
                const double progress = static_cast<double>(age - 40) / 20.0;
                return 10.0 + (60.0 - 10.0) * progress;
            }
            return 60.0;
        case GlidePathStrategy::Custom:
            break;
    }

    if (age < glidePath.startAge) return glidePath.startPct;
    if (age >= glidePath.endAge) return glidePath.endPct;

    const double progress = static_cast<double>(age - glidePath.startAge) /
                            static_cast<double>(glidePath.endAge - glidePath.startAge);
    double shaped = progress;
    switch (glidePath.shape) {
        case GlidePathShape::Linear:
            break;
        case GlidePathShape::Accelerated:
            shaped = std::sqrt(progress);
            break;
        case GlidePathShape::Decelerated:
            shaped = progress * progress;
            break;
    }
    return glidePath.startPct + (glidePath.endPct - glidePath.startPct) * shaped;
}

double bondReturnPct(double stockReturnPct) {
    return kBondNominalAvgPct + (stockReturnPct - kBondEquityBaselinePct) * kBondEquitySensitivity;
}

ReturnGenerator::ReturnGenerator(const ReturnGeneratorConfig& config, const HistoricalSeries& history)
    : config_(config), rng_(config.seed) {
    if (config_.glidePath.strategy == GlidePathStrategy::Custom &&
        config_.glidePath.endAge <= config_.glidePath.startAge) {
        throw std::invalid_argument("BondGlidePath.endAge must exceed startAge");
    }
    if (config_.mode == ReturnMode::Fixed) {
        return;
    }

    data_ = config_.mode == ReturnMode::Bootstrap ? history.bootstrapPool(kReturnClampPct, true)
                                                   : history.playbackValues(kReturnClampPct);
    if (data_.empty()) {
        throw std::invalid_argument("Return generator requires a non-empty historical series");
    }

    if (config_.mode == ReturnMode::Historical) {
        if (config_.startYear < history.startYear() || config_.startYear > history.endYear()) {
            throw std::invalid_argument("Historical start year " + std::to_string(config_.startYear) +
                                        " is outside " + std::to_string(history.startYear()) + "-" +
                                        std::to_string(history.endYear()));
        }
        startIndex_ = static_cast<std::size_t>(config_.startYear - history.startYear());
    } else {
        pick_ = std::uniform_int_distribution<std::size_t>(0, data_.size() - 1);
    }
}

double ReturnGenerator::blend(double stockPct) const {
    if (config_.glidePath.strategy == GlidePathStrategy::None) {
        return stockPct;
    }
    const double bondPct = bondAllocationPct(config_.currentAge + static_cast<int>(produced_), config_.glidePath) / 100.0;
    const double bondReturn = config_.mode == ReturnMode::Fixed ? kBondNominalAvgPct : bondReturnPct(stockPct);
    return (1.0 - bondPct) * stockPct + bondPct * bondReturn;
}

double ReturnGenerator::next() {
    if (!hasNext()) {
        throw std::out_of_range("Return generator horizon exhausted");
    }

    double factor = 0.0;
    if (config_.mode == ReturnMode::Fixed) {
        factor = 1.0 + blend(config_.nominalPct) / 100.0;
    } else {
        const std::size_t index = config_.mode == ReturnMode::Historical
                                      ? (startIndex_ + produced_) % data_.size()
                                      : pick_(rng_);
        const double pct = blend(data_[index]);
        factor = 1.0 + pct / 100.0;
        if (config_.series == ReturnSeries::Real) {
            factor /= 1.0 + config_.inflationPct / 100.0;
        }
    }

    ++produced_;
    return factor;
}

Eigen::ArrayXd ReturnGenerator::materialize() {
    Eigen::ArrayXd factors(static_cast<Eigen::Index>(remaining()));
    for (Eigen::Index i = 0; i < factors.size(); ++i) {
        factors[i] = next();
    }
    return factors;
}

}  // namespace retiresim
