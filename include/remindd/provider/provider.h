/**
 * @file provider.h
 * @brief Capability provider contract between the protocol layer and a reminder backend
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include "remindd/common.h"

namespace remindd {

/**
 * @brief Failure classes a backend may report
 */
enum class ProviderError {
    ACCESS_DENIED,
    NOT_FOUND,
    UNAVAILABLE,  // backend unreachable
    INVALID       // malformed input reached the backend
};

enum class AuthorizationStatus {
    UNKNOWN,
    GRANTED,
    DENIED
};

inline const char* to_string(ProviderError error) {
    switch (error) {
        case ProviderError::ACCESS_DENIED: return "access_denied";
        case ProviderError::NOT_FOUND: return "not_found";
        case ProviderError::UNAVAILABLE: return "unavailable";
        case ProviderError::INVALID: return "invalid";
        default: return "unknown";
    }
}

inline const char* to_string(AuthorizationStatus status) {
    switch (status) {
        case AuthorizationStatus::UNKNOWN: return "unknown";
        case AuthorizationStatus::GRANTED: return "granted";
        case AuthorizationStatus::DENIED: return "denied";
        default: return "unknown";
    }
}

/**
 * @brief Value or provider failure
 *
 * The message is diagnostic text for the log; it is never sent to clients.
 */
template <typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result err(ProviderError error, std::string message = "") {
        Result r;
        r.error_ = error;
        r.message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ProviderError error() const { return error_; }
    const std::string& message() const { return message_; }

private:
    Result() = default;

    std::optional<T> value_;
    ProviderError error_ = ProviderError::INVALID;
    std::string message_;
};

/**
 * @brief One reminder as seen by the protocol layer
 */
struct Reminder {
    std::string id;  // opaque, never parsed outside the backend
    std::string title;
    std::optional<std::string> notes;
    std::optional<TimePoint> due_date;
    bool completed = false;
    std::string list_name;

    json to_json() const;

    bool operator==(const Reminder& other) const;
};

struct ReminderList {
    std::string name;
    bool is_default = false;

    json to_json() const;

    bool operator==(const ReminderList& other) const {
        return name == other.name && is_default == other.is_default;
    }
};

/**
 * @brief Abstract reminder backend
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class ReminderProvider {
public:
    virtual ~ReminderProvider() = default;

    /**
     * @brief Ask the backend for access
     *
     * May block on an out-of-band decision. Re-invoking after a decision
     * must be idempotent.
     */
    virtual Result<AuthorizationStatus> request_authorization() = 0;

    /**
     * @brief Create a reminder
     * @param list_name Target list, default list when absent
     * @return Id of the new reminder
     */
    virtual Result<std::string> create(
        const std::string& title,
        const std::optional<std::string>& notes,
        const std::optional<TimePoint>& due_date,
        const std::optional<std::string>& list_name) = 0;

    /**
     * @brief List reminders of one list, in a stable backend-defined order
     * @param list_name List to read, default list when absent
     */
    virtual Result<std::vector<Reminder>> list(
        const std::optional<std::string>& list_name,
        bool include_completed) = 0;

    /**
     * @brief Mark a reminder completed
     * @return NOT_FOUND if the id does not resolve
     */
    virtual Result<bool> complete(const std::string& id) = 0;

    virtual Result<std::vector<ReminderList>> lists() = 0;

    /**
     * @brief Backend name for logging
     */
    virtual const char* name() const = 0;
};

} // namespace remindd
