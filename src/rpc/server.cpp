/**
 * @file server.cpp
 * @brief RpcServer implementation
 */

#include "remindd/rpc/server.h"
#include "remindd/logger.h"

namespace remindd {

RpcServer::RpcServer(StdioTransport& transport, Dispatcher& dispatcher)
    : transport_(transport), dispatcher_(dispatcher) {
}

RpcServer::~RpcServer() {
    stop();
}

bool RpcServer::start() {
    if (running_) {
        return true;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stop_reason_ = StopReason::NONE;
    }
    running_ = true;
    reader_thread_ = std::make_unique<std::thread>([this] { read_loop(); });
    LOG_INFO("RpcServer", "Reading requests from standard input");
    return true;
}

void RpcServer::stop() {
    if (running_.exchange(false)) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stop_reason_ == StopReason::NONE) {
            stop_reason_ = StopReason::REQUESTED;
        }
    }
    // The reader polls with a short timeout, so it notices within READ_POLL_MS
    if (reader_thread_ && reader_thread_->joinable() &&
        reader_thread_->get_id() != std::this_thread::get_id()) {
        reader_thread_->join();
    }
}

bool RpcServer::is_healthy() const {
    return running_.load() && dispatcher_.is_running();
}

void RpcServer::on_exit(ExitCallback callback) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    exit_callback_ = std::move(callback);
}

RpcServer::StopReason RpcServer::stop_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stop_reason_;
}

const char* RpcServer::to_string(StopReason reason) {
    switch (reason) {
        case StopReason::NONE: return "none";
        case StopReason::REQUESTED: return "requested";
        case StopReason::END_OF_STREAM: return "end_of_stream";
        case StopReason::TRANSPORT_ERROR: return "transport_error";
        default: return "unknown";
    }
}

void RpcServer::read_loop() {
    std::string frame;
    while (running_) {
        StdioTransport::ReadStatus status;
        try {
            status = transport_.read_frame(frame, READ_POLL_MS);
        } catch (const TransportError& e) {
            LOG_ERROR("RpcServer", "Transport failure: " + std::string(e.what()));
            finish(StopReason::TRANSPORT_ERROR);
            return;
        }

        switch (status) {
            case StdioTransport::ReadStatus::FRAME:
                process_frame(frame);
                break;
            case StdioTransport::ReadStatus::END_OF_STREAM:
                LOG_INFO("RpcServer", "Client closed the input stream");
                finish(StopReason::END_OF_STREAM);
                return;
            case StdioTransport::ReadStatus::TIMEOUT:
            default:
                break;
        }
    }
}

void RpcServer::finish(StopReason reason) {
    ExitCallback callback;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stop_reason_ == StopReason::NONE) {
            stop_reason_ = reason;
        }
        callback = exit_callback_;
    }
    running_ = false;
    if (callback) {
        callback(reason);
    }
}

void RpcServer::process_frame(const std::string& frame) {
    ++frames_received_;
    LOG_DEBUG("RpcServer", "Received: " + frame);

    DecodeResult decoded = Codec::decode(frame);
    if (decoded.error) {
        send(*decoded.error);
        return;
    }
    if (!decoded.request) {
        return;
    }

    Request request = std::move(*decoded.request);
    std::optional<RequestId> id = request.id;
    std::string method = request.method;

    auto status = dispatcher_.submit(std::move(request), [this](const Response& response) {
        send(response);
    });
    if (status == Dispatcher::SubmitStatus::QUEUED) {
        return;
    }

    LOG_WARN("RpcServer", std::string("Dispatcher ") + Dispatcher::to_string(status) +
             ", rejecting " + method);
    if (id) {
        const char* message = status == Dispatcher::SubmitStatus::FULL
            ? "Server busy, too many pending requests"
            : "Server is shutting down";
        send(Response::failure(id, ErrorCodes::INTERNAL_ERROR, message));
    }
}

void RpcServer::send(const Response& response) {
    std::string payload = Codec::encode(response);
    LOG_DEBUG("RpcServer", "Sending: " + payload);
    if (!transport_.write_message(payload)) {
        LOG_WARN("RpcServer", "Dropped response for id " +
                 (response.id() ? response.id()->to_string() : std::string("null")));
    }
}

} // namespace remindd
