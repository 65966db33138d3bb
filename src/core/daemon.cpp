/**
 * @file daemon.cpp
 * @brief Daemon supervisor implementation
 */

#include "remindd/core/daemon.h"
#include "remindd/rpc/handlers.h"
#include "remindd/logger.h"
#include <algorithm>
#include <csignal>
#include <thread>
#include <systemd/sd-daemon.h>

namespace remindd {

namespace {

std::atomic<int> g_stop_signals{0};
std::atomic<bool> g_reload_requested{false};

void signal_handler(int sig) {
    if (sig == SIGHUP) {
        g_reload_requested = true;
        return;
    }
    if (g_stop_signals.fetch_add(1) >= 1) {
        // Second termination signal: do not wait for in-flight work
        _exit(ExitCode::FORCED_SHUTDOWN);
    }
}

constexpr auto SUPERVISE_INTERVAL = std::chrono::milliseconds(100);

} // namespace

Daemon::Daemon(Config config,
               std::unique_ptr<ReminderProvider> provider,
               int input_fd,
               int output_fd)
    : config_(std::move(config)),
      provider_(std::move(provider)),
      gate_(*provider_, session_),
      dispatcher_(static_cast<size_t>(config_.workers), static_cast<size_t>(config_.max_pending)),
      transport_(input_fd, output_fd, config_.max_frame_bytes),
      server_(transport_, dispatcher_) {
    services_ = {&dispatcher_, &server_};
    std::sort(services_.begin(), services_.end(), [](const Service* a, const Service* b) {
        return a->priority() > b->priority();
    });
}

Daemon::~Daemon() {
    if (running_ && !forced_) {
        stop();
    }
    // Workers answer through transport_, which is destroyed before dispatcher_
    server_.stop();
    dispatcher_.stop();
}

void Daemon::install_signal_handlers() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    // A closed stdout must surface as a write error, not kill the process
    signal(SIGPIPE, SIG_IGN);
}

void Daemon::reset_signal_state() {
    g_stop_signals = 0;
    g_reload_requested = false;
}

int Daemon::start() {
    LOG_INFO("Daemon", std::string(NAME) + " " + VERSION + " starting with provider " + provider_->name());
    start_time_ = Clock::now();

    ReminderTools::register_all(tools_, *provider_);
    tools_.freeze();
    Handlers::register_all(dispatcher_, session_, gate_, tools_, [this] { return health(); });

    if (config_.request_authorization_on_start) {
        int code = authorize_on_start();
        if (code != ExitCode::OK) {
            return code;
        }
    }

    if (!start_services()) {
        return ExitCode::RUNTIME_FAILURE;
    }
    running_ = true;

    uint64_t watchdog_usec = 0;
    if (sd_watchdog_enabled(0, &watchdog_usec) > 0 && watchdog_usec > 0) {
        watchdog_interval_ = std::chrono::microseconds(watchdog_usec / 2);
        LOG_DEBUG("Daemon", "Watchdog enabled, interval " +
                  std::to_string(watchdog_interval_.count()) + "us");
    }

    notify_systemd("READY=1\nSTATUS=Serving " + std::to_string(tools_.size()) + " tools");
    LOG_INFO("Daemon", "Ready");
    return ExitCode::OK;
}

int Daemon::authorize_on_start() {
    auto auth = gate_.resolve();
    if (!auth) {
        switch (auth.error()) {
            case ProviderError::UNAVAILABLE:
                LOG_ERROR("Daemon", "Reminder store unavailable: " + auth.message());
                return ExitCode::STARTUP_TRANSIENT;
            case ProviderError::ACCESS_DENIED:
                if (!config_.authorization_required) {
                    LOG_WARN("Daemon", "Reminder access denied, tool calls will be refused");
                    return ExitCode::OK;
                }
                LOG_ERROR("Daemon", "Reminder access denied: " + auth.message());
                return ExitCode::STARTUP_PERMANENT;
            default:
                LOG_ERROR("Daemon", "Authorization failed: " + auth.message());
                return ExitCode::STARTUP_PERMANENT;
        }
    }

    if (auth.value() == AuthorizationStatus::DENIED) {
        if (config_.authorization_required) {
            LOG_ERROR("Daemon", "Reminder access denied and authorization is required");
            return ExitCode::STARTUP_PERMANENT;
        }
        LOG_WARN("Daemon", "Reminder access denied, tool calls will be refused");
    } else {
        LOG_INFO("Daemon", std::string("Authorization ") + to_string(auth.value()));
    }
    return ExitCode::OK;
}

bool Daemon::start_services() {
    server_.on_exit([this](RpcServer::StopReason reason) {
        if (reason == RpcServer::StopReason::TRANSPORT_ERROR) {
            transport_failed_ = true;
        }
        request_shutdown();
    });

    for (Service* service : services_) {
        LOG_DEBUG("Daemon", std::string("Starting ") + service->name());
        if (!service->start()) {
            LOG_ERROR("Daemon", std::string("Failed to start ") + service->name());
            for (Service* started : services_) {
                started->stop();
            }
            return false;
        }
    }
    return true;
}

int Daemon::run() {
    int code = start();
    if (code != ExitCode::OK) {
        return code;
    }

    auto last_watchdog = std::chrono::steady_clock::now();
    while (!shutdown_requested_) {
        std::this_thread::sleep_for(SUPERVISE_INTERVAL);

        if (g_stop_signals.load() > 0) {
            LOG_INFO("Daemon", "Received shutdown signal");
            break;
        }
        if (g_reload_requested.exchange(false)) {
            handle_reload();
        }
        if (watchdog_interval_.count() > 0) {
            auto now = std::chrono::steady_clock::now();
            if (now - last_watchdog >= watchdog_interval_) {
                notify_systemd("WATCHDOG=1");
                last_watchdog = now;
            }
        }
    }

    code = stop();
    if (code == ExitCode::OK && transport_failed_) {
        code = ExitCode::RUNTIME_FAILURE;
    }
    LOG_INFO("Daemon", "Exiting with code " + std::to_string(code));
    return code;
}

int Daemon::stop() {
    if (!running_.exchange(false)) {
        return forced_ ? ExitCode::FORCED_SHUTDOWN : ExitCode::OK;
    }

    notify_systemd("STOPPING=1\nSTATUS=Shutting down");
    LOG_INFO("Daemon", "Shutting down, " + std::to_string(dispatcher_.in_flight()) +
             " request(s) in flight");

    server_.stop();

    if (!dispatcher_.wait_idle(std::chrono::milliseconds(config_.shutdown_grace_ms))) {
        LOG_WARN("Daemon", "Grace period expired with " +
                 std::to_string(dispatcher_.in_flight()) + " request(s) unfinished");
        forced_ = true;
        return ExitCode::FORCED_SHUTDOWN;
    }

    dispatcher_.stop();
    LOG_INFO("Daemon", "Shutdown complete");
    return ExitCode::OK;
}

void Daemon::request_shutdown() {
    shutdown_requested_ = true;
}

std::chrono::seconds Daemon::uptime() const {
    if (start_time_ == TimePoint{}) {
        return std::chrono::seconds(0);
    }
    return std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - start_time_);
}

json Daemon::health() const {
    SessionSnapshot snap = session_.snapshot();
    json services = json::array();
    for (const Service* service : services_) {
        services.push_back({
            {"name", service->name()},
            {"running", service->is_running()},
            {"healthy", service->is_healthy()}
        });
    }

    return {
        {"version", VERSION},
        {"provider", provider_->name()},
        {"phase", to_string(snap.phase)},
        {"authorization", to_string(snap.authorization)},
        {"uptime_seconds", uptime().count()},
        {"in_flight", dispatcher_.in_flight()},
        {"running", running_.load()},
        {"services", services}
    };
}

void Daemon::handle_reload() {
    auto& manager = ConfigManager::instance();
    if (!manager.reload()) {
        LOG_WARN("Daemon", "Configuration reload failed, keeping current settings");
        return;
    }
    Config updated = manager.get();
    Logger::set_level(Logger::level_from_int(updated.log_level));
    if (updated.store_path != config_.store_path || updated.workers != config_.workers ||
        updated.max_pending != config_.max_pending ||
        updated.max_frame_bytes != config_.max_frame_bytes) {
        LOG_WARN("Daemon", "Store, worker and transport settings take effect after restart");
    }
    config_.log_level = updated.log_level;
    config_.shutdown_grace_ms = updated.shutdown_grace_ms;
    LOG_INFO("Daemon", "Configuration reloaded");
}

void Daemon::notify_systemd(const std::string& state) const {
    int rc = sd_notify(0, state.c_str());
    if (rc < 0) {
        LOG_DEBUG("Daemon", "sd_notify failed: " + std::to_string(rc));
    }
}

} // namespace remindd
