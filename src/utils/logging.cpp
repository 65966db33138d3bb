/**
 * @file logging.cpp
 * @brief Logger implementation (journald or stderr)
 */

#include <iostream>
#include <systemd/sd-journal.h>
// sd-journal.h pulls in syslog.h, whose priority macros collide with LOG_*
#undef LOG_DEBUG
#undef LOG_INFO
#include "remindd/logger.h"
#include "remindd/common.h"

namespace remindd {

LogLevel Logger::min_level_ = LogLevel::INFO;
bool Logger::use_journald_ = false;
std::mutex Logger::mutex_;
bool Logger::initialized_ = false;

void Logger::init(LogLevel min_level, bool use_journald) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = min_level;
    use_journald_ = use_journald;
    initialized_ = true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_ && !use_journald_) {
        std::cerr.flush();
    }
    min_level_ = LogLevel::INFO;
    use_journald_ = false;
    initialized_ = false;
}

void Logger::debug(const std::string& component, const std::string& message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(const std::string& component, const std::string& message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warn(const std::string& component, const std::string& message) {
    log(LogLevel::WARN, component, message);
}

void Logger::error(const std::string& component, const std::string& message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::critical(const std::string& component, const std::string& message) {
    log(LogLevel::CRITICAL, component, message);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

LogLevel Logger::level_from_int(int value) {
    if (value <= 0) return LogLevel::DEBUG;
    if (value >= 4) return LogLevel::CRITICAL;
    return static_cast<LogLevel>(value);
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    if (use_journald_) {
        log_to_journald(level, component, message);
    } else {
        log_to_stderr(level, component, message);
    }
}

void Logger::log_to_journald(LogLevel level, const std::string& component, const std::string& message) {
    sd_journal_send("MESSAGE=%s", message.c_str(),
                    "PRIORITY=%d", level_to_priority(level),
                    "SYSLOG_IDENTIFIER=%s", NAME,
                    "REMINDD_COMPONENT=%s", component.c_str(),
                    NULL);
}

void Logger::log_to_stderr(LogLevel level, const std::string& component, const std::string& message) {
    std::cerr << timestamp_iso() << " [" << level_to_string(level) << "] "
              << component << ": " << message << std::endl;
}

int Logger::level_to_priority(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return internal::SYSLOG_DEBUG;
        case LogLevel::INFO:
            return internal::SYSLOG_INFO;
        case LogLevel::WARN:
            return internal::SYSLOG_WARNING;
        case LogLevel::ERROR:
            return internal::SYSLOG_ERR;
        case LogLevel::CRITICAL:
            return internal::SYSLOG_CRIT;
        default:
            return internal::SYSLOG_INFO;
    }
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::CRITICAL:
            return "CRITICAL";
        default:
            return "UNKNOWN";
    }
}

} // namespace remindd
