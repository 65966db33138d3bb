/**
 * @file server.h
 * @brief Frame reader feeding the dispatcher and writing responses
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include "remindd/core/service.h"
#include "remindd/rpc/dispatcher.h"
#include "remindd/rpc/transport.h"

namespace remindd {

/**
 * @brief JSON-RPC server over a StdioTransport
 *
 * One reader thread turns frames into requests and hands them to the
 * dispatcher; responses come back through the transport's writer lock in
 * completion order.
 */
class RpcServer : public Service {
public:
    enum class StopReason {
        NONE,
        REQUESTED,       // stop() called
        END_OF_STREAM,   // client closed its end
        TRANSPORT_ERROR  // framing corruption or read failure
    };

    using ExitCallback = std::function<void(StopReason)>;

    RpcServer(StdioTransport& transport, Dispatcher& dispatcher);
    ~RpcServer() override;

    RpcServer(const RpcServer&) = delete;
    RpcServer& operator=(const RpcServer&) = delete;

    bool start() override;

    /**
     * @brief Stop reading new frames; in-flight requests keep running
     */
    void stop() override;

    const char* name() const override { return "RpcServer"; }
    int priority() const override { return 10; }
    bool is_running() const override { return running_.load(); }
    bool is_healthy() const override;

    /**
     * @brief Called from the reader thread when reading ends on its own
     */
    void on_exit(ExitCallback callback);

    StopReason stop_reason() const;

    uint64_t frames_received() const { return frames_received_.load(); }

    /**
     * @brief Decode one frame and route it (reader thread, also used by tests)
     */
    void process_frame(const std::string& frame);

    /**
     * @brief Serialize and write a response
     */
    void send(const Response& response);

    static const char* to_string(StopReason reason);

private:
    StdioTransport& transport_;
    Dispatcher& dispatcher_;

    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> reader_thread_;
    std::atomic<uint64_t> frames_received_{0};

    mutable std::mutex state_mutex_;
    StopReason stop_reason_ = StopReason::NONE;
    ExitCallback exit_callback_;

    void read_loop();
    void finish(StopReason reason);
};

} // namespace remindd
