#include "batch_runner.hpp"

#include "path_simulator.hpp"

#include <Eigen/Dense>
#include <atomic>
#include <exception>
#include <random>
#include <utility>

namespace retiresim {

namespace {

constexpr std::uint32_t kSeedSpace = 1000000;

}  // namespace

std::vector<std::uint32_t> deriveSeeds(std::uint32_t baseSeed, std::size_t count) {
    std::mt19937_64 rng(baseSeed);
    std::uniform_int_distribution<std::uint32_t> draw(0, kSeedSpace - 1);
    std::vector<std::uint32_t> seeds(count);
    for (auto& seed : seeds) {
        seed = draw(rng);
    }
    return seeds;
}

BatchResult BatchRunner::run(const SimulationParams& params,
                             const BatchConfig& config,
                             const ProgressCallback& progress,
                             const CancellationToken& token) const {
    if (config.paths == 0) {
        throw std::invalid_argument("BatchConfig.paths must be positive");
    }
    if (config.progressInterval == 0) {
        throw std::invalid_argument("BatchConfig.progressInterval must be positive");
    }

    const PathSimulator simulator(params, data_);
    const std::size_t paths = config.paths;
    const auto years = static_cast<Eigen::Index>(params.trajectoryLength());
    const std::vector<std::uint32_t> seeds = deriveSeeds(config.baseSeed, paths);

    Eigen::MatrixXd real(static_cast<Eigen::Index>(paths), years);
    Eigen::MatrixXd nominal(static_cast<Eigen::Index>(paths), years);
    std::vector<PathSummary> runs(paths);
    std::vector<double> conversions(paths, 0.0);

    std::size_t completed = 0;
    std::atomic<bool> failed{false};
    std::exception_ptr failure;

#pragma omp parallel for schedule(dynamic, 16)
    for (std::size_t i = 0; i < paths; ++i) {
        if (failed.load() || token.cancelled()) {
            continue;
        }
        try {
            const PathResult path = simulator.run(seeds[i]);
            const auto row = static_cast<Eigen::Index>(i);
            for (Eigen::Index t = 0; t < years; ++t) {
                const YearlyState& state = path.trajectory[static_cast<std::size_t>(t)];
                real(row, t) = state.real;
                nominal(row, t) = state.nominal;
            }
            runs[i] = {path.eolReal, path.y1AfterTaxReal, path.ruined, path.survivalYears};
            conversions[i] = path.totalRothConversions;
        } catch (...) {
#pragma omp critical(batch_failure)
            {
                if (!failure) failure = std::current_exception();
            }
            failed.store(true);
            continue;
        }

        // Counting and reporting share one critical section so the callback
        // sees completion counts in increasing order.
#pragma omp critical(batch_progress)
        {
            const std::size_t done = ++completed;
            if (progress && !failed.load() && (done % config.progressInterval == 0 || done == paths)) {
                try {
                    progress(done, paths);
                } catch (...) {
#pragma omp critical(batch_failure)
                    {
                        if (!failure) failure = std::current_exception();
                    }
                    failed.store(true);
                }
            }
        }
    }  // omp parallel for

    if (failure) {
        std::rethrow_exception(failure);
    }
    token.throwIfCancelled();

    const std::size_t trim = trimCountFor(paths, config.tailTrimFraction);

    std::vector<double> eol(paths);
    std::vector<double> y1(paths);
    std::size_t ruinedCount = 0;
    double conversionSum = 0.0;
    for (std::size_t i = 0; i < paths; ++i) {
        eol[i] = runs[i].eolReal;
        y1[i] = runs[i].y1AfterTaxReal;
        if (runs[i].ruined) ++ruinedCount;
        conversionSum += conversions[i];
    }

    BatchResult result;
    result.real = columnBands(real, trim);
    result.nominal = columnBands(nominal, trim);
    result.eolReal = trimmedQuartiles(eol, trim);
    result.y1AfterTaxReal = trimmedQuartiles(y1, trim);
    result.probRuin = static_cast<double>(ruinedCount) / static_cast<double>(paths);
    result.meanRothConversions = conversionSum / static_cast<double>(paths);
    result.runs = std::move(runs);
    return result;
}

}  // namespace retiresim
