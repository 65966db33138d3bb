/**
 * @file common.h
 * @brief Common types, constants, and utilities for remindd
 */

#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <nlohmann/json.hpp>

namespace remindd {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Version information
constexpr const char* VERSION = "1.0.0";
constexpr const char* NAME = "remindd";

// Protocol revision advertised during initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";
constexpr const char* JSONRPC_VERSION = "2.0";

// Default paths
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/remindd/remindd.yaml";
constexpr const char* DEFAULT_USER_CONFIG_PATH = "~/.config/remindd/remindd.yaml";
constexpr const char* DEFAULT_STORE_PATH = "~/.local/share/remindd/reminders.db";
constexpr const char* DEFAULT_LIST_NAME = "Reminders";

// Transport
constexpr size_t MAX_FRAME_BYTES = 1024 * 1024;
constexpr size_t READ_CHUNK_BYTES = 4096;
constexpr int READ_POLL_MS = 100;

// Dispatch
constexpr int DEFAULT_WORKERS = 4;
constexpr int DEFAULT_SHUTDOWN_GRACE_MS = 5000;
constexpr int DEFAULT_MAX_PENDING = 256;

/**
 * @brief Process exit statuses consumed by the external supervisor
 */
namespace ExitCode {
    constexpr int OK = 0;
    constexpr int RUNTIME_FAILURE = 1;    // transport corruption, unexpected error
    constexpr int STARTUP_PERMANENT = 2;  // will never succeed without operator action
    constexpr int STARTUP_TRANSIENT = 3;  // retry may succeed
    constexpr int FORCED_SHUTDOWN = 4;    // second signal or grace period expired
}

/**
 * @brief Expand ~ to home directory in paths
 */
inline std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

/**
 * @brief Format a time point as ISO 8601 UTC (thread-safe)
 */
std::string format_timestamp(TimePoint tp);

/**
 * @brief Get current timestamp in ISO format (thread-safe)
 */
inline std::string timestamp_iso() {
    return format_timestamp(Clock::now());
}

/**
 * @brief Parse an ISO 8601 date or date-time
 *
 * Accepts YYYY-MM-DD and YYYY-MM-DDTHH:MM[:SS][.fff][Z|+HH:MM|-HH:MM].
 * A date-time without an offset is read as UTC.
 *
 * @return Time point, or nullopt if the text is not a valid timestamp
 */
std::optional<TimePoint> parse_timestamp(const std::string& text);

} // namespace remindd
