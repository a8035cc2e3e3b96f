#include "engine_worker.hpp"

#include "guardrails.hpp"
#include "legacy_simulator.hpp"
#include "roth_optimizer.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace retiresim {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

void dispatch(const Request& request,
              const EngineData& data,
              const MessageSink& sink,
              const CancellationToken& token,
              const OptimizerConfig& optimizer) {
    const RequestId id = requestId(request);
    try {
        std::visit(Overloaded{
                       [&](const RunRequest& r) {
                           const BatchRunner runner(data);
                           BatchResult result = runner.run(
                               r.params, r.batch,
                               [&](std::size_t completed, std::size_t total) {
                                   sink(ProgressMessage{id, completed, total});
                               },
                               token);
                           sink(CompleteMessage{id, std::move(result)});
                       },
                       [&](const LegacyRequest& r) { sink(LegacyCompleteMessage{id, simulateLegacy(r.params)}); },
                       [&](const GuardrailsRequest& r) {
                           sink(GuardrailsCompleteMessage{id, estimateGuardrailsImpact(r.runs, r.spendingReduction)});
                       },
                       [&](const RothOptimizerRequest& r) {
                           sink(RothOptimizerCompleteMessage{id, optimizeRothConversions(r.params, data.tables)});
                       },
                       [&](const OptimizeRequest& r) {
                           const GoalSeeker seeker(data, optimizer);
                           sink(OptimizeCompleteMessage{id, seeker.solve(r.params, r.baseSeed, token)});
                       },
                   },
                   request);
    } catch (const std::exception& ex) {
        sink(ErrorMessage{id, ex.what()});
    }
}

EngineWorker::EngineWorker(const EngineData& data, MessageSink sink, OptimizerConfig optimizer)
    : data_(data), sink_(std::move(sink)), optimizer_(optimizer), thread_([this] { loop(); }) {}

EngineWorker::~EngineWorker() {
    std::deque<Request> dropped;
    {
        std::lock_guard guard(mutex_);
        stopping_ = true;
        dropped.swap(queue_);
    }
    token_.cancel();
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    // Queued requests still owe their submitters a terminal message.
    for (const Request& request : dropped) {
        try {
            sink_(ErrorMessage{requestId(request), "engine shutting down"});
        } catch (const std::exception& ex) {
            std::cerr << "[retiresim] failed to report dropped request: " << ex.what() << '\n';
        }
    }
}

void EngineWorker::submit(Request request) {
    {
        std::lock_guard guard(mutex_);
        queue_.push_back(std::move(request));
    }
    cv_.notify_one();
}

void EngineWorker::cancelCurrent() {
    token_.cancel();
}

std::size_t EngineWorker::pending() const {
    std::lock_guard guard(mutex_);
    return queue_.size();
}

void EngineWorker::loop() {
    for (;;) {
        Request request;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            request = std::move(queue_.front());
            queue_.pop_front();
            token_.reset();
        }
        dispatch(request, data_, sink_, token_, optimizer_);
    }
}

}  // namespace retiresim
