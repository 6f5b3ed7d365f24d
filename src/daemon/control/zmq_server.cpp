#include "daemon/control/zmq_server.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <zmq.hpp>

namespace daemon_ipc {
namespace {

constexpr const char* kUnknownBucket = "<unknown>";
constexpr const char* kMalformedBucket = "<malformed>";

std::string normalizeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return name;
}

// A crashed daemon leaves its ipc socket file behind and bind() then fails
void removeStaleIpcFile(const std::string& endpoint) {
    constexpr std::string_view kIpc = "ipc://";
    if (!endpoint.starts_with(kIpc) || endpoint.size() == kIpc.size()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(endpoint.substr(kIpc.size()), ec);
}

}  // namespace

ZmqCommandServer::ZmqCommandServer(std::string endpoint, int pollIntervalMs)
    : endpoint_(std::move(endpoint)),
      pubEndpoint_(derivePubEndpoint(endpoint_)),
      pollIntervalMs_(pollIntervalMs) {}

ZmqCommandServer::~ZmqCommandServer() {
    stop();
}

void ZmqCommandServer::registerCommand(const std::string& command, Handler handler) {
    handlers_[normalizeName(command)] = std::move(handler);
}

std::vector<std::string> ZmqCommandServer::commands() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    return names;
}

bool ZmqCommandServer::start() {
    if (running_.load()) {
        return true;
    }

    try {
        context_ = std::make_unique<zmq::context_t>(1);

        repSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
        repSocket_->set(zmq::sockopt::linger, 0);
        removeStaleIpcFile(endpoint_);
        repSocket_->bind(endpoint_);

        pubSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
        pubSocket_->set(zmq::sockopt::linger, 0);
        removeStaleIpcFile(pubEndpoint_);
        pubSocket_->bind(pubEndpoint_);
    } catch (const zmq::error_t& e) {
        LOG_ERROR("Control socket bind failed on {}: {}", endpoint_, e.what());
        bindFailed_.store(true);
        closeSockets();
        return false;
    }

    bindFailed_.store(false);
    running_.store(true);
    serverThread_ = std::thread(&ZmqCommandServer::serverLoop, this);
    LOG_INFO("Control socket listening on {} ({} commands), events on {}", endpoint_,
             handlers_.size(), pubEndpoint_);
    return true;
}

void ZmqCommandServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (serverThread_.joinable()) {
        serverThread_.join();
    }
    closeSockets();
    removeStaleIpcFile(endpoint_);
    removeStaleIpcFile(pubEndpoint_);
    LOG_INFO("Control socket on {} closed", endpoint_);
}

bool ZmqCommandServer::publishEvent(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!pubSocket_) {
        return false;
    }

    IpcEvent event = makeEvent(payload);
    try {
        pubSocket_->send(zmq::buffer(event.topic), zmq::send_flags::sndmore);
        pubSocket_->send(zmq::buffer(event.body), zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
        LOG_EVERY_N(WARN, 20, "Dropping {} event: {}", event.topic, e.what());
        return false;
    }
    return true;
}

std::string ZmqCommandServer::handle(const std::string& raw) {
    auto started = std::chrono::steady_clock::now();
    IpcRequest request = parseRequest(raw);
    std::string response = dispatch(request);
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    std::string bucket = request.command;
    if (!request.parseError.empty()) {
        bucket = kMalformedBucket;
    } else if (handlers_.find(bucket) == handlers_.end()) {
        bucket = kUnknownBucket;
    }
    record(bucket, elapsed, isErrorResponse(request, response));

    if (elapsed >= std::chrono::milliseconds(DaemonConstants::ZEROMQ_SLOW_HANDLER_MS)) {
        LOG_WARN("{} took {} ms", bucket,
                 std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    }
    return response;
}

std::string ZmqCommandServer::dispatch(const IpcRequest& request) {
    using CastEngine::ErrorCode;

    if (!request.parseError.empty()) {
        return buildErrorResponse(request, ErrorCode::IPC_PROTOCOL_ERROR,
                                  "JSON parse error: " + request.parseError);
    }

    auto handler = handlers_.find(request.command);
    if (handler == handlers_.end()) {
        return buildErrorResponse(
            request, ErrorCode::IPC_INVALID_COMMAND,
            "Unknown command: " + (request.command.empty() ? std::string("<empty>")
                                                           : request.command));
    }

    try {
        return handler->second(request);
    } catch (const nlohmann::json::exception& e) {
        LOG_DEBUG("{} rejected parameters: {}", request.command, e.what());
        return buildErrorResponse(request, ErrorCode::IPC_INVALID_PARAMS,
                                  std::string("Invalid parameters: ") + e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("{} handler failed: {}", request.command, e.what());
        return buildErrorResponse(request, ErrorCode::INTERNAL_UNKNOWN,
                                  std::string("Handler exception: ") + e.what());
    }
}

void ZmqCommandServer::record(const std::string& command, std::chrono::microseconds elapsed,
                              bool failed) {
    std::lock_guard<std::mutex> lock(statsMutex_);
    CommandStats& entry = stats_[command];
    ++entry.requests;
    if (failed) {
        ++entry.errors;
    }
    entry.totalTime += elapsed;
    entry.maxTime = std::max(entry.maxTime, elapsed);
}

std::map<std::string, CommandStats> ZmqCommandServer::commandStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

nlohmann::json ZmqCommandServer::commandStatsJson() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, entry] : commandStats()) {
        double avgMs = entry.requests == 0
                           ? 0.0
                           : static_cast<double>(entry.totalTime.count()) / 1000.0 /
                                 static_cast<double>(entry.requests);
        out[name] = {{"requests", entry.requests},
                     {"errors", entry.errors},
                     {"avg_ms", avgMs},
                     {"max_ms", static_cast<double>(entry.maxTime.count()) / 1000.0}};
    }
    return out;
}

void ZmqCommandServer::serverLoop() {
    zmq::pollitem_t items[] = {{static_cast<void*>(*repSocket_), 0, ZMQ_POLLIN, 0}};

    while (running_.load()) {
        try {
            zmq::poll(items, 1, std::chrono::milliseconds(pollIntervalMs_));
            if ((items[0].revents & ZMQ_POLLIN) == 0) {
                continue;
            }

            zmq::message_t message;
            if (!repSocket_->recv(message, zmq::recv_flags::dontwait)) {
                continue;
            }
            std::string reply = handle(message.to_string());
            repSocket_->send(zmq::buffer(reply), zmq::send_flags::none);
        } catch (const zmq::error_t& e) {
            if (e.num() == ETERM) {
                break;
            }
            LOG_EVERY_N(ERROR, 20, "Control socket error: {}", e.what());
        }
    }
}

void ZmqCommandServer::closeSockets() {
    std::lock_guard<std::mutex> lock(pubMutex_);
    // socket_t destructors close without throwing
    repSocket_.reset();
    pubSocket_.reset();
    context_.reset();
}

}  // namespace daemon_ipc
