#include "engine_worker.hpp"
#include "param_parsing.hpp"
#include "protocol.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#ifdef _OPENMP
#include <omp.h>
#endif

#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

using namespace retiresim;

namespace {

using Clock = std::chrono::system_clock;

std::string trimCopy(std::string_view text) {
    std::size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::string urlDecode(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];
        if (c == '%' && i + 2 < input.size()) {
            auto hex = [](char ch) -> int {
                if (ch >= '0' && ch <= '9') return ch - '0';
                if (ch >= 'a' && ch <= 'f') return 10 + (ch - 'a');
                if (ch >= 'A' && ch <= 'F') return 10 + (ch - 'A');
                return -1;
            };
            const int h = hex(input[i + 1]);
            const int l = hex(input[i + 2]);
            if (h >= 0 && l >= 0) {
                result.push_back(static_cast<char>((h << 4) | l));
                i += 2;
                continue;
            }
        }
        result.push_back(c == '+' ? ' ' : c);
    }
    return result;
}

ArgMap parseQuery(const std::string& query) {
    ArgMap params;
    std::size_t start = 0;
    while (start < query.size()) {
        const std::size_t end = query.find('&', start);
        const std::size_t stop = end == std::string::npos ? query.size() : end;
        const std::size_t eq = query.find('=', start);
        if (eq != std::string::npos && eq < stop) {
            params[trimCopy(urlDecode(std::string_view(query).substr(start, eq - start)))] =
                trimCopy(urlDecode(std::string_view(query).substr(eq + 1, stop - eq - 1)));
        } else if (stop > start) {
            // A bare flag reads as true, matching the CLI.
            params[trimCopy(urlDecode(std::string_view(query).substr(start, stop - start)))] = "true";
        }
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return params;
}

std::string isoTimestamp(const Clock::time_point tp) {
    const std::time_t time = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

int threadCount() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

struct SimulationRecord {
    RequestId id = 0;
    std::string endpoint;
    std::string outcome;  // message type of the terminal reply
    std::string timestamp;
    double durationSeconds = 0.0;
    int threadCount = 1;
    std::size_t pathsSimulated = 0;
    std::optional<double> probRuin;
};

class SimulationLedger {
public:
    explicit SimulationLedger(std::size_t maxRecords) : maxRecords_(maxRecords) {}

    void push(SimulationRecord record) {
        std::lock_guard guard(mutex_);
        records_.push_front(std::move(record));
        while (records_.size() > maxRecords_) {
            records_.pop_back();
        }
    }

    [[nodiscard]] std::vector<SimulationRecord> snapshot() const {
        std::lock_guard guard(mutex_);
        return {records_.begin(), records_.end()};
    }

private:
    const std::size_t maxRecords_;
    mutable std::mutex mutex_;
    std::deque<SimulationRecord> records_;
};

std::string toJson(const SimulationRecord& rec) {
    std::ostringstream oss;
    oss << "{"
        << "\"id\":" << rec.id << ","
        << "\"endpoint\":\"" << jsonEscape(rec.endpoint) << "\","
        << "\"outcome\":\"" << rec.outcome << "\","
        << "\"timestamp\":\"" << rec.timestamp << "\","
        << "\"durationSeconds\":" << rec.durationSeconds << ","
        << "\"threadCount\":" << rec.threadCount;
    if (rec.pathsSimulated > 0) {
        oss << ",\"pathsSimulated\":" << rec.pathsSimulated;
    }
    if (rec.probRuin) {
        oss << ",\"probRuin\":" << *rec.probRuin;
    }
    oss << "}";
    return oss.str();
}

std::string toJson(const std::vector<SimulationRecord>& records) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < records.size(); ++i) {
        oss << toJson(records[i]);
        if (i + 1 < records.size()) {
            oss << ",";
        }
    }
    oss << "]";
    return oss.str();
}

struct ParsedRequest {
    std::string method;
    std::string path;
    std::string query;
};

std::optional<ParsedRequest> parseRequestLine(const std::string& request) {
    const std::size_t endLine = request.find("\r\n");
    if (endLine == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream line(request.substr(0, endLine));
    ParsedRequest parsed;
    if (!(line >> parsed.method)) return std::nullopt;

    std::string target;
    if (!(line >> target)) return std::nullopt;

    const std::size_t qpos = target.find('?');
    if (qpos != std::string::npos) {
        parsed.path = target.substr(0, qpos);
        parsed.query = target.substr(qpos + 1);
    } else {
        parsed.path = target;
    }
    return parsed;
}

std::string httpResponse(const std::string& body,
                         const std::string& contentType = "application/json",
                         int status = 200,
                         const std::string& statusText = "OK") {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << ' ' << statusText << "\r\n"
        << "Content-Type: " << contentType << "; charset=utf-8\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << body;
    return oss.str();
}

void sendAll(int clientFd, const std::string& payload) {
    std::size_t sent = 0;
    while (sent < payload.size()) {
        const ssize_t n = ::send(clientFd, payload.data() + sent, payload.size() - sent, 0);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return;
        }
        sent += static_cast<std::size_t>(n);
    }
}

struct ServerConfig {
    int port = 8080;
    std::size_t maxRecords = 128;
    std::optional<std::string> returnsCsv;
};

ServerConfig parseArgs(int argc, char** argv) {
    ServerConfig cfg;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            cfg.port = std::stoi(argv[++i]);
        } else if (arg == "--max-records" && i + 1 < argc) {
            cfg.maxRecords = static_cast<std::size_t>(std::stoull(argv[++i]));
        } else if (arg == "--returns-csv" && i + 1 < argc) {
            cfg.returnsCsv = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: retiresim_server [--port N] [--max-records N] [--returns-csv PATH]\n"
                         "Endpoints (GET, parameters in the query string):\n"
                         "  /api/run /api/optimize /api/guardrails /api/roth /api/legacy\n"
                         "  /api/progress /api/cancel /api/simulations\n";
            std::exit(0);
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return cfg;
}

int createListeningSocket(int port) {
    const int serverFd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (serverFd < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    int opt = 1;
    if (setsockopt(serverFd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        ::close(serverFd);
        throw std::runtime_error("setsockopt failed");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(serverFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(serverFd);
        throw std::runtime_error("bind failed (port in use?)");
    }

    if (listen(serverFd, SOMAXCONN) < 0) {
        ::close(serverFd);
        throw std::runtime_error("listen failed");
    }

    return serverFd;
}

// Routes worker messages back to the client threads waiting on them and keeps
// the latest progress of requests still in flight.
class ReplyRouter {
public:
    std::future<Message> expect(RequestId id) {
        std::lock_guard guard(mutex_);
        return waiting_[id].get_future();
    }

    void deliver(const Message& message) {
        const RequestId id = messageId(message);
        std::lock_guard guard(mutex_);
        if (const auto* progress = std::get_if<ProgressMessage>(&message)) {
            progress_[id] = *progress;
            return;
        }
        progress_.erase(id);
        const auto it = waiting_.find(id);
        if (it == waiting_.end()) {
            std::cerr << "[retiresim_server] warning: reply for unknown request " << id << std::endl;
            return;
        }
        it->second.set_value(message);
        waiting_.erase(it);
    }

    [[nodiscard]] std::vector<ProgressMessage> inFlight() const {
        std::lock_guard guard(mutex_);
        std::vector<ProgressMessage> out;
        out.reserve(progress_.size());
        for (const auto& [id, progress] : progress_) {
            out.push_back(progress);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<RequestId, std::promise<Message>> waiting_;
    std::map<RequestId, ProgressMessage> progress_;
};

class RetireSimServer {
public:
    RetireSimServer(ServerConfig cfg, EngineData data)
        : config_(std::move(cfg)),
          ledger_(config_.maxRecords),
          data_(std::move(data)),
          worker_(data_, [this](const Message& m) { router_.deliver(m); }),
          serverFd_(createListeningSocket(config_.port)) {}

    ~RetireSimServer() {
        stop();
    }

    void run() {
        std::cout << "[retiresim_server] listening on port " << config_.port << std::endl;
        running_.store(true);
        while (running_.load()) {
            sockaddr_in clientAddr{};
            socklen_t addrLen = sizeof(clientAddr);
            const int clientFd = ::accept(serverFd_, reinterpret_cast<sockaddr*>(&clientAddr), &addrLen);
            if (clientFd < 0) {
                if (errno == EINTR) continue;
                std::perror("accept");
                continue;
            }
            std::thread(&RetireSimServer::serveClient, this, clientFd).detach();
        }
    }

    void stop() {
        running_.store(false);
        if (serverFd_ >= 0) {
            ::close(serverFd_);
            serverFd_ = -1;
        }
    }

private:
    void serveClient(int clientFd) {
        try {
            std::string request;
            char buffer[4096];
            while (true) {
                const ssize_t received = ::recv(clientFd, buffer, sizeof(buffer), 0);
                if (received <= 0) break;
                request.append(buffer, static_cast<std::size_t>(received));
                if (request.find("\r\n\r\n") != std::string::npos) break;
            }

            if (request.empty()) {
                ::close(clientFd);
                return;
            }

            const auto parsed = parseRequestLine(request);
            if (!parsed) {
                sendAll(clientFd, httpResponse("Bad Request", "text/plain", 400, "Bad Request"));
                ::close(clientFd);
                return;
            }

            if (parsed->method != "GET") {
                sendAll(clientFd, httpResponse("Method Not Allowed", "text/plain", 405, "Method Not Allowed"));
                ::close(clientFd);
                return;
            }

            const ArgMap params = parseQuery(parsed->query);

            if (parsed->path == "/api/simulations") {
                sendAll(clientFd, httpResponse(toJson(ledger_.snapshot())));
            } else if (parsed->path == "/api/progress") {
                sendAll(clientFd, httpResponse(progressJson()));
            } else if (parsed->path == "/api/cancel") {
                worker_.cancelCurrent();
                std::cout << "[retiresim_server] cancel requested" << std::endl;
                sendAll(clientFd, httpResponse("{\"cancelled\":true}"));
            } else if (parsed->path == "/api/run") {
                const SimulationParams sim = parseSimulationParams(params);
                const BatchConfig batch = parseBatchConfig(params);
                respond(clientFd, parsed->path, [&](RequestId id) { return Request{RunRequest{id, sim, batch}}; });
            } else if (parsed->path == "/api/optimize") {
                const SimulationParams sim = parseSimulationParams(params);
                const std::uint32_t seed = parseBatchConfig(params).baseSeed;
                respond(clientFd, parsed->path, [&](RequestId id) { return Request{OptimizeRequest{id, sim, seed}}; });
            } else if (parsed->path == "/api/roth") {
                const RothOptimizerParams roth = parseRothOptimizerParams(params);
                respond(clientFd, parsed->path, [&](RequestId id) { return Request{RothOptimizerRequest{id, roth}}; });
            } else if (parsed->path == "/api/legacy") {
                const LegacyParams legacy = parseLegacyParams(params);
                respond(clientFd, parsed->path, [&](RequestId id) { return Request{LegacyRequest{id, legacy}}; });
            } else if (parsed->path == "/api/guardrails") {
                handleGuardrails(params, clientFd);
            } else {
                sendAll(clientFd, httpResponse("Not Found", "text/plain", 404, "Not Found"));
            }

        } catch (const std::invalid_argument& ex) {
            sendAll(clientFd, httpResponse(retiresim::toJson(ErrorMessage{0, ex.what()}), "application/json", 400, "Bad Request"));
        } catch (const std::exception& ex) {
            sendAll(clientFd,
                    httpResponse(retiresim::toJson(ErrorMessage{0, ex.what()}), "application/json", 500, "Internal Server Error"));
        }
        ::close(clientFd);
    }

    // Queues one request on the worker and blocks until its terminal message.
    Message submitAndWait(const std::string& endpoint, const std::function<Request(RequestId)>& build) {
        const RequestId id = nextId_.fetch_add(1);
        std::future<Message> reply = router_.expect(id);
        const auto start = Clock::now();
        worker_.submit(build(id));
        Message message = reply.get();
        const double duration = std::chrono::duration<double>(Clock::now() - start).count();

        SimulationRecord record;
        record.id = id;
        record.endpoint = endpoint;
        record.outcome = messageType(message);
        record.timestamp = isoTimestamp(Clock::now());
        record.durationSeconds = duration;
        record.threadCount = threadCount();
        if (const auto* complete = std::get_if<CompleteMessage>(&message)) {
            record.pathsSimulated = complete->result.runs.size();
            record.probRuin = complete->result.probRuin;
        }
        ledger_.push(std::move(record));

        std::cout << "[retiresim_server] " << endpoint << " #" << id << " " << messageType(message) << " in "
                  << std::fixed << std::setprecision(3) << duration << "s" << std::endl;
        return message;
    }

    void respond(int clientFd, const std::string& endpoint, const std::function<Request(RequestId)>& build) {
        sendMessage(clientFd, submitAndWait(endpoint, build));
    }

    static void sendMessage(int clientFd, const Message& message) {
        if (std::holds_alternative<ErrorMessage>(message)) {
            sendAll(clientFd, httpResponse(retiresim::toJson(message), "application/json", 422, "Unprocessable Entity"));
        } else {
            sendAll(clientFd, httpResponse(retiresim::toJson(message)));
        }
    }

    // The estimate needs per-path outcomes, so a batch runs first.
    void handleGuardrails(const ArgMap& params, int clientFd) {
        const SimulationParams sim = parseSimulationParams(params);
        const BatchConfig batch = parseBatchConfig(params);
        const double reduction = parseSpendingReduction(params);

        const Message batchReply =
            submitAndWait("/api/guardrails", [&](RequestId id) { return Request{RunRequest{id, sim, batch}}; });
        const auto* complete = std::get_if<CompleteMessage>(&batchReply);
        if (complete == nullptr) {
            sendMessage(clientFd, batchReply);
            return;
        }
        const std::vector<PathSummary>& runs = complete->result.runs;
        respond(clientFd, "/api/guardrails",
                [&](RequestId id) { return Request{GuardrailsRequest{id, runs, reduction}}; });
    }

    [[nodiscard]] std::string progressJson() const {
        std::ostringstream oss;
        oss << "{\"pending\":" << worker_.pending() << ",\"inFlight\":[";
        const auto progress = router_.inFlight();
        for (std::size_t i = 0; i < progress.size(); ++i) {
            oss << retiresim::toJson(progress[i]);
            if (i + 1 < progress.size()) {
                oss << ",";
            }
        }
        oss << "]}";
        return oss.str();
    }

    ServerConfig config_;
    SimulationLedger ledger_;
    EngineData data_;
    ReplyRouter router_;
    EngineWorker worker_;
    std::atomic<RequestId> nextId_{1};
    std::atomic<bool> running_{false};
    int serverFd_;
};

}  // namespace

int main(int argc, char** argv) {
    try {
        ServerConfig cfg = parseArgs(argc, argv);

        std::optional<HistoricalSeries> history;
        if (cfg.returnsCsv) {
            history = HistoricalSeries::loadFromCsv(*cfg.returnsCsv);
            std::cout << "[retiresim_server] loaded return history " << history->startYear() << "-"
                      << history->endYear() << " from " << *cfg.returnsCsv << std::endl;
        } else {
            history = HistoricalSeries::sp500();
            std::cout << "[retiresim_server] using built-in S&P 500 history (provide --returns-csv to override)\n";
        }

        EngineData data(TaxTables::us2026(), std::move(*history));
        RetireSimServer server(std::move(cfg), std::move(data));
        server.run();

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
