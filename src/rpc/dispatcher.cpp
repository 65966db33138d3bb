/**
 * @file dispatcher.cpp
 * @brief Dispatcher implementation
 */

#include "remindd/rpc/dispatcher.h"
#include "remindd/logger.h"

namespace remindd {

Dispatcher::Dispatcher(size_t worker_count, size_t max_pending)
    : worker_count_(worker_count == 0 ? 1 : worker_count),
      max_pending_(max_pending == 0 ? 1 : max_pending) {
}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::register_handler(const std::string& method, Handler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[method] = std::move(handler);
    LOG_DEBUG("Dispatcher", "Registered handler for: " + method);
}

bool Dispatcher::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return handlers_.count(method) > 0;
}

bool Dispatcher::start() {
    if (running_) {
        return true;
    }
    running_ = true;
    for (size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&Dispatcher::worker_loop, this);
    }
    LOG_INFO("Dispatcher", "Started " + std::to_string(worker_count_) + " workers");
    return true;
}

void Dispatcher::stop() {
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    LOG_INFO("Dispatcher", "Stopped");
}

Dispatcher::SubmitStatus Dispatcher::submit(Request request, Responder responder) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            return SubmitStatus::STOPPED;
        }
        if (in_flight_ >= max_pending_) {
            return SubmitStatus::FULL;
        }
        tasks_.push(Task{std::move(request), std::move(responder)});
        ++in_flight_;
    }
    queue_cv_.notify_one();
    return SubmitStatus::QUEUED;
}

const char* Dispatcher::to_string(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::QUEUED: return "queued";
        case SubmitStatus::STOPPED: return "stopped";
        case SubmitStatus::FULL: return "full";
        default: return "unknown";
    }
}

std::optional<Response> Dispatcher::handle(const Request& request) const {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(request.method);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        if (request.is_notification()) {
            LOG_DEBUG("Dispatcher", "Ignoring unknown notification: " + request.method);
            return std::nullopt;
        }
        LOG_WARN("Dispatcher", "Unknown method: " + request.method);
        return Response::failure(request.id, ErrorCodes::METHOD_NOT_FOUND,
                                 "Method not found: " + request.method);
    }

    std::optional<Response> response;
    try {
        response = handler(request);
    } catch (const json::exception& e) {
        LOG_ERROR("Dispatcher", "JSON error in handler '" + request.method + "': " + e.what());
        response = Response::failure(request.id, ErrorCodes::INTERNAL_ERROR, "Internal error");
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatcher", "Handler '" + request.method + "' failed: " + e.what());
        response = Response::failure(request.id, ErrorCodes::INTERNAL_ERROR, "Internal error");
    }

    if (request.is_notification()) {
        return std::nullopt;
    }
    // Handlers build responses from request.id; a mismatch is an internal fault
    if (response->id() != request.id) {
        LOG_ERROR("Dispatcher", "Handler '" + request.method + "' answered with a foreign id");
        return Response::failure(request.id, ErrorCodes::INTERNAL_ERROR, "Internal error");
    }
    return response;
}

bool Dispatcher::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

size_t Dispatcher::in_flight() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return in_flight_;
}

void Dispatcher::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !tasks_.empty() || !running_; });

            if (!running_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        auto response = handle(task.request);
        if (response && task.responder) {
            try {
                task.responder(*response);
            } catch (const std::exception& e) {
                LOG_ERROR("Dispatcher", "Failed to deliver response: " + std::string(e.what()));
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --in_flight_;
            if (in_flight_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace remindd
