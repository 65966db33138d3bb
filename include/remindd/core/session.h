/**
 * @file session.h
 * @brief Negotiation and authorization state shared by all handlers
 */

#pragma once

#include <mutex>
#include <cstdint>
#include "remindd/common.h"
#include "remindd/provider/provider.h"

namespace remindd {

enum class SessionPhase {
    UNINITIALIZED,
    INITIALIZING,
    READY
};

inline const char* to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::UNINITIALIZED: return "uninitialized";
        case SessionPhase::INITIALIZING: return "initializing";
        case SessionPhase::READY: return "ready";
        default: return "unknown";
    }
}

/**
 * @brief Consistent view of both state axes
 */
struct SessionSnapshot {
    SessionPhase phase = SessionPhase::UNINITIALIZED;
    AuthorizationStatus authorization = AuthorizationStatus::UNKNOWN;

    json to_json() const {
        return {
            {"phase", to_string(phase)},
            {"authorization", to_string(authorization)}
        };
    }
};

/**
 * @brief Process-wide session state
 *
 * phase moves UNINITIALIZED -> INITIALIZING -> READY and only the initialize
 * handler moves it. A failed authorization attempt drops INITIALIZING back
 * to UNINITIALIZED. authorization is written by AuthorizationGate only.
 */
class Session {
public:
    enum class BeginResult {
        STARTED,      // caller owns the INITIALIZING phase and must call finish_initialize()
        IN_PROGRESS,  // another initialize is running
        ALREADY_READY
    };

    Session() = default;
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    SessionSnapshot snapshot() const;
    SessionPhase phase() const;
    AuthorizationStatus authorization() const;

    BeginResult begin_initialize();

    /**
     * @brief Leave INITIALIZING
     * @param ready true moves to READY, false back to UNINITIALIZED
     */
    void finish_initialize(bool ready);

private:
    friend class AuthorizationGate;

    void set_authorization(AuthorizationStatus status);

    mutable std::mutex mutex_;
    SessionPhase phase_ = SessionPhase::UNINITIALIZED;
    AuthorizationStatus authorization_ = AuthorizationStatus::UNKNOWN;
};

/**
 * @brief Single-flight wrapper around ReminderProvider::request_authorization()
 *
 * Callers that arrive while a request is outstanding wait for it and share
 * its answer. GRANTED is cached; after DENIED the next call asks again.
 */
class AuthorizationGate {
public:
    AuthorizationGate(ReminderProvider& provider, Session& session);

    AuthorizationGate(const AuthorizationGate&) = delete;
    AuthorizationGate& operator=(const AuthorizationGate&) = delete;

    Result<AuthorizationStatus> resolve();

    /**
     * @brief Number of times the provider was actually asked
     */
    uint64_t attempts() const;

private:
    ReminderProvider& provider_;
    Session& session_;

    std::mutex resolve_mutex_;
    mutable std::mutex state_mutex_;
    uint64_t generation_ = 0;
    uint64_t attempts_ = 0;
    std::optional<Result<AuthorizationStatus>> last_;
};

} // namespace remindd
