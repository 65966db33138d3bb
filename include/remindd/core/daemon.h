/**
 * @file daemon.h
 * @brief Supervisor owning the session, dispatcher and stdio server
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>
#include <unistd.h>
#include "remindd/common.h"
#include "remindd/config.h"
#include "remindd/core/service.h"
#include "remindd/core/session.h"
#include "remindd/provider/provider.h"
#include "remindd/rpc/dispatcher.h"
#include "remindd/rpc/server.h"
#include "remindd/rpc/tools.h"
#include "remindd/rpc/transport.h"

namespace remindd {

/**
 * @brief Process supervisor
 *
 * Wires the provider into the tool registry and handler table, starts the
 * services in priority order and turns their outcome into a process exit
 * code (see ExitCode).
 */
class Daemon {
public:
    Daemon(Config config,
           std::unique_ptr<ReminderProvider> provider,
           int input_fd = STDIN_FILENO,
           int output_fd = STDOUT_FILENO);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /**
     * @brief Register tools and handlers, authorize eagerly, start services
     * @return ExitCode::OK, or the startup failure code
     */
    int start();

    /**
     * @brief start(), then supervise until shutdown
     * @return Process exit code
     */
    int run();

    /**
     * @brief Stop reading, drain in-flight requests for the grace period
     * @return ExitCode::OK or ExitCode::FORCED_SHUTDOWN
     */
    int stop();

    /**
     * @brief Ask the run loop to exit (thread-safe)
     */
    void request_shutdown();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Workers were still busy when the grace period ended
     *
     * The caller must leave with std::_Exit; joining would block on them.
     */
    bool requires_immediate_exit() const { return forced_.load(); }

    std::chrono::seconds uptime() const;

    json health() const;

    const Session& session() const { return session_; }
    const ToolRegistry& tools() const { return tools_; }
    Dispatcher& dispatcher() { return dispatcher_; }
    RpcServer& server() { return server_; }

    /**
     * @brief SIGTERM/SIGINT request shutdown, a second one exits at once,
     *        SIGHUP reloads configuration, SIGPIPE is ignored
     */
    static void install_signal_handlers();

    /**
     * @brief Clear pending signal flags (tests)
     */
    static void reset_signal_state();

private:
    Config config_;
    std::unique_ptr<ReminderProvider> provider_;

    Session session_;
    AuthorizationGate gate_;
    ToolRegistry tools_;
    Dispatcher dispatcher_;
    StdioTransport transport_;
    RpcServer server_;

    std::vector<Service*> services_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> forced_{false};
    std::atomic<bool> transport_failed_{false};
    TimePoint start_time_;

    std::chrono::microseconds watchdog_interval_{0};

    int authorize_on_start();
    bool start_services();
    void handle_reload();
    void notify_systemd(const std::string& state) const;
};

} // namespace remindd
