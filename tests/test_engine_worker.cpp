#include "engine_worker.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

using namespace retiresim;

namespace {

const EngineData& engineData() {
    static const EngineData data = EngineData::defaults();
    return data;
}

// Thread-safe message log that can wait for a number of terminal messages.
class Collector {
public:
    void operator()(const Message& message) {
        {
            std::lock_guard guard(mutex_);
            messages_.push_back(message);
            if (isTerminal(message)) ++terminal_;
        }
        cv_.notify_all();
    }

    std::vector<Message> waitForTerminal(std::size_t count) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, std::chrono::seconds(60), [&] { return terminal_ >= count; });
        return messages_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Message> messages_;
    std::size_t terminal_ = 0;
};

std::vector<Message> terminalOnly(const std::vector<Message>& messages) {
    std::vector<Message> out;
    for (const auto& m : messages) {
        if (isTerminal(m)) out.push_back(m);
    }
    return out;
}

SimulationParams shortRetirement() {
    SimulationParams p;
    p.age1 = 60;
    p.retirementAge = 61;
    p.lifeExpectancy = 75;
    p.taxableBalance = 500000.0;
    p.returnMode = ReturnMode::Bootstrap;
    return p;
}

RunRequest runRequest(RequestId id, std::size_t paths) {
    BatchConfig batch;
    batch.paths = paths;
    batch.progressInterval = 10;
    return RunRequest{id, shortRetirement(), batch};
}

}  // namespace

TEST_CASE("dispatch answers with a typed message", "[worker]") {
    std::vector<Message> messages;
    const MessageSink sink = [&](const Message& m) { messages.push_back(m); };

    RothOptimizerParams roth;
    dispatch(RothOptimizerRequest{11, roth}, engineData(), sink);
    REQUIRE(messages.size() == 1);
    REQUIRE(std::holds_alternative<RothOptimizerCompleteMessage>(messages[0]));
    REQUIRE(messageId(messages[0]) == 11);
}

TEST_CASE("dispatch turns failures into error messages", "[worker]") {
    std::vector<Message> messages;
    const MessageSink sink = [&](const Message& m) { messages.push_back(m); };

    dispatch(GuardrailsRequest{4, {}, 0.1}, engineData(), sink);
    REQUIRE(messages.size() == 1);
    const auto* error = std::get_if<ErrorMessage>(&messages[0]);
    REQUIRE(error != nullptr);
    REQUIRE(error->id == 4);
    REQUIRE_FALSE(error->message.empty());
}

TEST_CASE("dispatch streams progress before completion", "[worker]") {
    std::vector<Message> messages;
    const MessageSink sink = [&](const Message& m) { messages.push_back(m); };

    dispatch(runRequest(8, 40), engineData(), sink);
    REQUIRE(messages.size() == 5);
    for (std::size_t i = 0; i < 4; ++i) {
        REQUIRE(std::holds_alternative<ProgressMessage>(messages[i]));
    }
    const auto* complete = std::get_if<CompleteMessage>(&messages.back());
    REQUIRE(complete != nullptr);
    REQUIRE(complete->result.runs.size() == 40);
}

TEST_CASE("cancelling mid-batch reports an error", "[worker]") {
    CancellationToken token;
    std::vector<Message> messages;
    const MessageSink sink = [&](const Message& m) {
        messages.push_back(m);
        if (std::holds_alternative<ProgressMessage>(m)) token.cancel();
    };

    dispatch(runRequest(3, 2000), engineData(), sink, token);
    const auto* error = std::get_if<ErrorMessage>(&messages.back());
    REQUIRE(error != nullptr);
    REQUIRE(error->message == "Simulation cancelled");
}

TEST_CASE("worker keeps serving after a failed request", "[worker]") {
    Collector collector;
    EngineWorker worker(engineData(), [&](const Message& m) { collector(m); });

    worker.submit(GuardrailsRequest{1, {}, 0.1});
    LegacyParams legacy;
    legacy.eolNominal = 1000000.0;
    legacy.perBeneficiaryReal = 100000.0;
    legacy.capYears = 100;
    worker.submit(LegacyRequest{2, legacy});

    const std::vector<Message> terminal = terminalOnly(collector.waitForTerminal(2));
    REQUIRE(terminal.size() == 2);
    REQUIRE(std::holds_alternative<ErrorMessage>(terminal[0]));
    REQUIRE(messageId(terminal[0]) == 1);
    REQUIRE(std::holds_alternative<LegacyCompleteMessage>(terminal[1]));
    REQUIRE(messageId(terminal[1]) == 2);
}

TEST_CASE("worker cancellation affects only the running request", "[worker]") {
    Collector collector;
    std::atomic<EngineWorker*> self{nullptr};
    std::atomic<bool> cancelSent{false};
    EngineWorker worker(engineData(), [&](const Message& m) {
        collector(m);
        if (messageId(m) == 1 && std::holds_alternative<ProgressMessage>(m) && !cancelSent.exchange(true)) {
            self.load()->cancelCurrent();
        }
    });
    self.store(&worker);

    worker.submit(runRequest(1, 2000));
    worker.submit(runRequest(2, 20));

    const std::vector<Message> terminal = terminalOnly(collector.waitForTerminal(2));
    REQUIRE(terminal.size() == 2);
    const auto* error = std::get_if<ErrorMessage>(&terminal[0]);
    REQUIRE(error != nullptr);
    REQUIRE(error->message == "Simulation cancelled");
    REQUIRE(std::holds_alternative<CompleteMessage>(terminal[1]));
    REQUIRE(messageId(terminal[1]) == 2);
}

TEST_CASE("shutting down answers every queued request", "[worker]") {
    Collector collector;
    {
        EngineWorker worker(engineData(), [&](const Message& m) { collector(m); });
        worker.submit(runRequest(1, 200000));
        worker.submit(runRequest(2, 20));
        worker.submit(runRequest(3, 20));
    }

    const std::vector<Message> terminal = terminalOnly(collector.waitForTerminal(3));
    REQUIRE(terminal.size() == 3);
    std::vector<RequestId> ids;
    for (const auto& m : terminal) {
        const auto* error = std::get_if<ErrorMessage>(&m);
        REQUIRE(error != nullptr);
        ids.push_back(error->id);
    }
    std::sort(ids.begin(), ids.end());
    REQUIRE(ids == std::vector<RequestId>{1, 2, 3});

    const auto* last = std::get_if<ErrorMessage>(&terminal.back());
    REQUIRE(last->message == "engine shutting down");
}
