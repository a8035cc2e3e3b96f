#pragma once

#include "batch_runner.hpp"
#include "guardrails.hpp"
#include "legacy_simulator.hpp"
#include "optimizer.hpp"
#include "roth_optimizer.hpp"
#include "simulation_params.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace retiresim {

using RequestId = std::uint64_t;

struct RunRequest {
    RequestId id = 0;
    SimulationParams params;
    BatchConfig batch;
};

struct LegacyRequest {
    RequestId id = 0;
    LegacyParams params;
};

struct GuardrailsRequest {
    RequestId id = 0;
    std::vector<PathSummary> runs;
    double spendingReduction = 0.1;
};

struct RothOptimizerRequest {
    RequestId id = 0;
    RothOptimizerParams params;
};

struct OptimizeRequest {
    RequestId id = 0;
    SimulationParams params;
    std::uint32_t baseSeed = 12345;
};

using Request = std::variant<RunRequest, LegacyRequest, GuardrailsRequest, RothOptimizerRequest, OptimizeRequest>;

struct ProgressMessage {
    RequestId id = 0;
    std::size_t completed = 0;
    std::size_t total = 0;
};

struct CompleteMessage {
    RequestId id = 0;
    BatchResult result;
};

struct LegacyCompleteMessage {
    RequestId id = 0;
    LegacyResult result;
};

struct GuardrailsCompleteMessage {
    RequestId id = 0;
    GuardrailsResult result;
};

struct RothOptimizerCompleteMessage {
    RequestId id = 0;
    RothOptimizerResult result;
};

struct OptimizeCompleteMessage {
    RequestId id = 0;
    OptimizationResult result;
};

struct ErrorMessage {
    RequestId id = 0;
    std::string message;
};

using Message = std::variant<ProgressMessage,
                             CompleteMessage,
                             LegacyCompleteMessage,
                             GuardrailsCompleteMessage,
                             RothOptimizerCompleteMessage,
                             OptimizeCompleteMessage,
                             ErrorMessage>;

[[nodiscard]] RequestId requestId(const Request& request);
[[nodiscard]] RequestId messageId(const Message& message);

// Every message except progress ends its request.
[[nodiscard]] bool isTerminal(const Message& message);

// Wire name of the message ("progress", "complete", "roth-optimizer-complete", ...).
[[nodiscard]] const char* messageType(const Message& message);

// Single-line JSON object with a "type" field, the request id and either the
// payload fields or a "result" object.
[[nodiscard]] std::string toJson(const Message& message);

[[nodiscard]] std::string jsonEscape(const std::string& text);

}  // namespace retiresim
