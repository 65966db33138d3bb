/**
 * @file dispatcher.h
 * @brief Method table and worker pool for concurrent request handling
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include "remindd/core/service.h"
#include "remindd/rpc/protocol.h"

namespace remindd {

/**
 * @brief Routes requests to handlers on a pool of worker threads
 *
 * submit() never blocks on handler execution, so a slow provider call does
 * not stall the frame reader. Each request with an id produces exactly one
 * response through its responder; notifications produce none.
 */
class Dispatcher : public Service {
public:
    using Handler = std::function<Response(const Request&)>;
    using Responder = std::function<void(const Response&)>;

    enum class SubmitStatus {
        QUEUED,
        STOPPED,  // not running
        FULL      // max_pending requests already queued or executing
    };

    explicit Dispatcher(size_t worker_count = DEFAULT_WORKERS,
                        size_t max_pending = DEFAULT_MAX_PENDING);
    ~Dispatcher() override;

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Register handler for a method (replaces an existing one)
     */
    void register_handler(const std::string& method, Handler handler);

    bool has_handler(const std::string& method) const;

    /**
     * @brief Start worker threads
     */
    bool start() override;

    /**
     * @brief Stop accepting work, finish queued tasks and join workers
     */
    void stop() override;

    const char* name() const override { return "Dispatcher"; }
    int priority() const override { return 20; }
    bool is_running() const override { return running_.load(); }

    /**
     * @brief Queue a request for a worker
     *
     * The responder is not called unless the request was QUEUED.
     */
    SubmitStatus submit(Request request, Responder responder);

    /**
     * @brief Run a request on the calling thread
     * @return Response, or nullopt for notifications
     */
    std::optional<Response> handle(const Request& request) const;

    /**
     * @brief Wait until no request is queued or executing
     * @return false on timeout
     */
    bool wait_idle(std::chrono::milliseconds timeout);

    /**
     * @brief Requests queued or executing
     */
    size_t in_flight() const;

    size_t worker_count() const { return worker_count_; }
    size_t max_pending() const { return max_pending_; }

    static const char* to_string(SubmitStatus status);

private:
    struct Task {
        Request request;
        Responder responder;
    };

    size_t worker_count_;
    size_t max_pending_;
    std::map<std::string, Handler> handlers_;
    mutable std::mutex handlers_mutex_;

    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    size_t in_flight_ = 0;  // guarded by queue_mutex_

    void worker_loop();
};

} // namespace remindd
