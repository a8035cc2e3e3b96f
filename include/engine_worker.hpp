#pragma once

#include "batch_runner.hpp"
#include "engine_data.hpp"
#include "optimizer.hpp"
#include "protocol.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace retiresim {

// Receives every message a request produces. Progress messages of a batch may
// be delivered from OpenMP pool threads, one at a time.
using MessageSink = std::function<void(const Message&)>;

// Executes one request synchronously. Failures become an ErrorMessage; the
// function itself does not throw for request errors.
void dispatch(const Request& request,
              const EngineData& data,
              const MessageSink& sink,
              const CancellationToken& token = CancellationToken(),
              const OptimizerConfig& optimizer = OptimizerConfig());

// Serves requests in FIFO order on one background thread.
class EngineWorker {
public:
    EngineWorker(const EngineData& data, MessageSink sink, OptimizerConfig optimizer = {});
    ~EngineWorker();

    EngineWorker(const EngineWorker&) = delete;
    EngineWorker& operator=(const EngineWorker&) = delete;

    void submit(Request request);

    // Cooperative: the running batch stops between paths and reports an error.
    void cancelCurrent();

    [[nodiscard]] std::size_t pending() const;

private:
    void loop();

    const EngineData& data_;
    MessageSink sink_;
    OptimizerConfig optimizer_;
    CancellationToken token_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Request> queue_;
    bool stopping_ = false;
    std::thread thread_;
};

}  // namespace retiresim
