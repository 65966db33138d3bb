/**
 * @file session.cpp
 * @brief Session state machine and authorization gate
 */

#include "remindd/core/session.h"
#include "remindd/logger.h"

namespace remindd {

SessionSnapshot Session::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSnapshot snap;
    snap.phase = phase_;
    snap.authorization = authorization_;
    return snap;
}

SessionPhase Session::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

AuthorizationStatus Session::authorization() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return authorization_;
}

Session::BeginResult Session::begin_initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (phase_) {
        case SessionPhase::UNINITIALIZED:
            phase_ = SessionPhase::INITIALIZING;
            return BeginResult::STARTED;
        case SessionPhase::INITIALIZING:
            return BeginResult::IN_PROGRESS;
        case SessionPhase::READY:
        default:
            return BeginResult::ALREADY_READY;
    }
}

void Session::finish_initialize(bool ready) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != SessionPhase::INITIALIZING) {
        return;
    }
    phase_ = ready ? SessionPhase::READY : SessionPhase::UNINITIALIZED;
}

void Session::set_authorization(AuthorizationStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    authorization_ = status;
}

AuthorizationGate::AuthorizationGate(ReminderProvider& provider, Session& session)
    : provider_(provider), session_(session) {
}

Result<AuthorizationStatus> AuthorizationGate::resolve() {
    uint64_t seen;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        seen = generation_;
    }

    std::lock_guard<std::mutex> resolving(resolve_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        // Somebody resolved while we were waiting: share their answer
        if (generation_ != seen && last_) {
            return *last_;
        }
    }

    if (session_.authorization() == AuthorizationStatus::GRANTED) {
        return Result<AuthorizationStatus>::ok(AuthorizationStatus::GRANTED);
    }

    LOG_INFO("Authorization", std::string("Requesting access from provider '") + provider_.name() + "'");
    auto result = provider_.request_authorization();

    if (result.is_ok()) {
        session_.set_authorization(result.value());
        LOG_INFO("Authorization", std::string("Provider access ") + to_string(result.value()));
    } else {
        LOG_WARN("Authorization", std::string("Authorization request failed (") +
                 to_string(result.error()) + "): " + result.message());
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    ++attempts_;
    ++generation_;
    last_ = result;
    return result;
}

uint64_t AuthorizationGate::attempts() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return attempts_;
}

} // namespace remindd
