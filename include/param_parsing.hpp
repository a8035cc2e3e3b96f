#pragma once

#include "batch_runner.hpp"
#include "legacy_simulator.hpp"
#include "roth_optimizer.hpp"
#include "simulation_params.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace retiresim {

// Request parameters as they arrive from CLI flags or an HTTP query string.
using ArgMap = std::unordered_map<std::string, std::string>;

// Getters return the default when the key is absent and throw
// std::invalid_argument when the value is present but malformed.
[[nodiscard]] double getDouble(const ArgMap& args, const std::string& name, double defaultValue);
[[nodiscard]] int getInt(const ArgMap& args, const std::string& name, int defaultValue);
[[nodiscard]] std::size_t getSizeT(const ArgMap& args, const std::string& name, std::size_t defaultValue);
[[nodiscard]] bool getBool(const ArgMap& args, const std::string& name, bool defaultValue);
[[nodiscard]] std::string getString(const ArgMap& args, const std::string& name, std::string defaultValue);
[[nodiscard]] std::vector<int> getIntList(const ArgMap& args, const std::string& name, std::vector<int> defaults);

[[nodiscard]] FilingStatus parseFilingStatus(const std::string& text);
[[nodiscard]] ReturnMode parseReturnMode(const std::string& text);
[[nodiscard]] ReturnSeries parseReturnSeries(const std::string& text);
[[nodiscard]] GlidePathStrategy parseGlidePathStrategy(const std::string& text);
[[nodiscard]] GlidePathShape parseGlidePathShape(const std::string& text);

[[nodiscard]] SimulationParams parseSimulationParams(const ArgMap& args);
[[nodiscard]] BatchConfig parseBatchConfig(const ArgMap& args);
[[nodiscard]] RothOptimizerParams parseRothOptimizerParams(const ArgMap& args);
[[nodiscard]] LegacyParams parseLegacyParams(const ArgMap& args);

// Decimal spending cut for the guardrails estimate (0.1 = 10%).
[[nodiscard]] double parseSpendingReduction(const ArgMap& args);

}  // namespace retiresim
