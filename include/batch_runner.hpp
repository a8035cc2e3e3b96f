#pragma once

#include "engine_data.hpp"
#include "simulation_params.hpp"
#include "statistics.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

namespace retiresim {

struct BatchConfig {
    std::uint32_t baseSeed = 12345;
    std::size_t paths = 2000;
    std::size_t progressInterval = 50;
    double tailTrimFraction = 0.025;
};

struct PathSummary {
    double eolReal = 0.0;
    double y1AfterTaxReal = 0.0;
    bool ruined = false;
    int survivalYears = 0;
};

struct BatchResult {
    PercentileBands real;
    PercentileBands nominal;
    Quartiles eolReal;
    Quartiles y1AfterTaxReal;
    double probRuin = 0.0;
    double meanRothConversions = 0.0;
    std::vector<PathSummary> runs;
};

// Invoked with (completed, total); calls are serialized.
using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

class SimulationCancelled : public std::runtime_error {
public:
    SimulationCancelled() : std::runtime_error("Simulation cancelled") {}
};

// Shared cooperative cancellation flag. Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { flag_->store(true); }
    void reset() const noexcept { flag_->store(false); }
    [[nodiscard]] bool cancelled() const noexcept { return flag_->load(); }

    // Throws SimulationCancelled once cancel() has been called.
    void throwIfCancelled() const {
        if (cancelled()) throw SimulationCancelled();
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Child seeds for a batch, reproducible from the base seed alone.
[[nodiscard]] std::vector<std::uint32_t> deriveSeeds(std::uint32_t baseSeed, std::size_t count);

class BatchRunner {
public:
    explicit BatchRunner(const EngineData& data) : data_(data) {}

    // Runs config.paths independent paths (in parallel when OpenMP is
    // available) and aggregates trimmed percentile bands.
    [[nodiscard]] BatchResult run(const SimulationParams& params,
                                  const BatchConfig& config,
                                  const ProgressCallback& progress = {},
                                  const CancellationToken& token = CancellationToken()) const;

private:
    const EngineData& data_;
};

}  // namespace retiresim
