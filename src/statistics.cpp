#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace retiresim {

namespace {

constexpr double kMaxTailFraction = 0.125;

}  // namespace

double percentileSorted(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        throw std::invalid_argument("percentile of an empty sample");
    }
    const double clamped = std::min(100.0, std::max(0.0, p));
    const double index = clamped / 100.0 * static_cast<double>(sorted.size() - 1);
    const auto lower = static_cast<std::size_t>(std::floor(index));
    const auto upper = static_cast<std::size_t>(std::ceil(index));
    if (lower == upper) {
        return sorted[lower];
    }
    const double weight = index - static_cast<double>(lower);
    return sorted[lower] * (1.0 - weight) + sorted[upper] * weight;
}

double percentile(std::vector<double> values, double p) {
    std::sort(values.begin(), values.end());
    return percentileSorted(values, p);
}

std::vector<double> trimExtremeValues(std::vector<double> values, std::size_t trimCount) {
    if (values.size() <= 2 * trimCount) {
        throw std::invalid_argument("Cannot trim " + std::to_string(trimCount) + " values per tail from " +
                                    std::to_string(values.size()) + " samples");
    }
    std::sort(values.begin(), values.end());
    return std::vector<double>(values.begin() + static_cast<std::ptrdiff_t>(trimCount),
                               values.end() - static_cast<std::ptrdiff_t>(trimCount));
}

std::size_t trimCountFor(std::size_t paths, double tailFraction) {
    const double fraction = std::min(std::max(0.0, tailFraction), kMaxTailFraction);
    return static_cast<std::size_t>(std::floor(static_cast<double>(paths) * fraction));
}

PercentileBands columnBands(const Eigen::MatrixXd& samples, std::size_t trimCount) {
    const auto years = static_cast<std::size_t>(samples.cols());
    PercentileBands bands;
    bands.p10.resize(years);
    bands.p25.resize(years);
    bands.p50.resize(years);
    bands.p75.resize(years);
    bands.p90.resize(years);

    std::vector<double> column(static_cast<std::size_t>(samples.rows()));
    for (std::size_t t = 0; t < years; ++t) {
        for (Eigen::Index i = 0; i < samples.rows(); ++i) {
            column[static_cast<std::size_t>(i)] = samples(i, static_cast<Eigen::Index>(t));
        }
        const std::vector<double> trimmed = trimExtremeValues(column, trimCount);
        bands.p10[t] = percentileSorted(trimmed, 10.0);
        bands.p25[t] = percentileSorted(trimmed, 25.0);
        bands.p50[t] = percentileSorted(trimmed, 50.0);
        bands.p75[t] = percentileSorted(trimmed, 75.0);
        bands.p90[t] = percentileSorted(trimmed, 90.0);
    }
    return bands;
}

Quartiles trimmedQuartiles(const std::vector<double>& values, std::size_t trimCount) {
    const std::vector<double> trimmed = trimExtremeValues(values, trimCount);
    return {percentileSorted(trimmed, 25.0), percentileSorted(trimmed, 50.0), percentileSorted(trimmed, 75.0)};
}

}  // namespace retiresim
