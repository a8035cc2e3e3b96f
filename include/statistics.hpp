#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace retiresim {

// Linear interpolation between order statistics of an already sorted array;
// p in [0, 100].
[[nodiscard]] double percentileSorted(const std::vector<double>& sorted, double p);

// Sorts a copy, then interpolates.
[[nodiscard]] double percentile(std::vector<double> values, double p);

// Sorted copy with trimCount values dropped from each tail. Throws
// std::invalid_argument unless values.size() > 2 * trimCount.
[[nodiscard]] std::vector<double> trimExtremeValues(std::vector<double> values, std::size_t trimCount);

// Per-tail trim count: floor(paths * min(tailFraction, 0.125)), which always
// leaves at least one value.
[[nodiscard]] std::size_t trimCountFor(std::size_t paths, double tailFraction);

struct PercentileBands {
    std::vector<double> p10;
    std::vector<double> p25;
    std::vector<double> p50;
    std::vector<double> p75;
    std::vector<double> p90;
};

struct Quartiles {
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
};

// Trimmed percentile bands of every column of a paths x years matrix.
[[nodiscard]] PercentileBands columnBands(const Eigen::MatrixXd& samples, std::size_t trimCount);

[[nodiscard]] Quartiles trimmedQuartiles(const std::vector<double>& values, std::size_t trimCount);

}  // namespace retiresim
