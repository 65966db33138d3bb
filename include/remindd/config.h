/**
 * @file config.h
 * @brief Configuration management for remindd
 */

#pragma once

#include <string>
#include <optional>
#include <mutex>
#include <vector>
#include <functional>
#include "remindd/common.h"

namespace remindd {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    // Logging
    int log_level = 1;  // 0=DEBUG, 1=INFO, 2=WARN, 3=ERROR, 4=CRITICAL
    bool use_journald = false;

    // Transport
    size_t max_frame_bytes = MAX_FRAME_BYTES;

    // Dispatch
    int workers = DEFAULT_WORKERS;
    int shutdown_grace_ms = DEFAULT_SHUTDOWN_GRACE_MS;
    int max_pending = DEFAULT_MAX_PENDING;  // requests queued or executing

    // Authorization
    bool request_authorization_on_start = true;
    bool authorization_required = false;

    // Reminder store
    std::string store_path = DEFAULT_STORE_PATH;
    std::string default_list = DEFAULT_LIST_NAME;

    /**
     * @brief Load configuration from YAML file
     * @param path Path to configuration file
     * @return Config if successful, nullopt on error
     */
    static std::optional<Config> load(const std::string& path);

    /**
     * @brief Save configuration to YAML file
     * @param path Path to save to
     * @return true if successful
     */
    bool save(const std::string& path) const;

    /**
     * @brief Get default configuration
     */
    static Config defaults();

    /**
     * @brief Expand ~ in all path fields
     */
    void expand_paths();

    /**
     * @brief Validate configuration
     * @return Empty string if valid, error message otherwise
     */
    std::string validate() const;

    json to_json() const;
};

/**
 * @brief Configuration manager singleton
 *
 * Thread-safe configuration management with change notification support.
 */
class ConfigManager {
public:
    using ChangeCallback = std::function<void(const Config&)>;

    static ConfigManager& instance();

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return true if loaded successfully
     */
    bool load(const std::string& path);

    /**
     * @brief Load from the first existing default location, or keep defaults
     * @return false only if a file exists but is invalid
     */
    bool load_default();

    /**
     * @brief Reload configuration from previously loaded path
     * @return true if reloaded successfully
     */
    bool reload();

    /**
     * @brief Get current configuration (returns copy for thread safety)
     */
    Config get() const;

    /**
     * @brief Path of the loaded file, empty when running on defaults
     */
    std::string path() const;

    /**
     * @brief Register callback for configuration changes
     */
    void on_change(ChangeCallback callback);

    /**
     * @brief Drop loaded state and callbacks (tests)
     */
    void reset();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

private:
    ConfigManager() = default;

    Config config_;
    std::string config_path_;
    mutable std::mutex mutex_;
    std::vector<ChangeCallback> callbacks_;

    /**
     * @brief Notify callbacks without holding the mutex
     *
     * Callbacks may call back into ConfigManager::get().
     */
    void notify_callbacks_unlocked(
        const std::vector<ChangeCallback>& callbacks,
        const Config& config);
};

} // namespace remindd
