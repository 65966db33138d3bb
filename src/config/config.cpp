/**
 * @file config.cpp
 * @brief YAML configuration loading and the ConfigManager singleton
 */

#include "remindd/config.h"
#include "remindd/logger.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace remindd {

namespace {

template <typename T>
void read_value(const YAML::Node& node, const char* key, T& out) {
    if (node && node[key]) {
        out = node[key].as<T>();
    }
}

} // namespace

std::optional<Config> Config::load(const std::string& path) {
    try {
        YAML::Node root = YAML::LoadFile(path);
        Config config = defaults();

        read_value(root, "log_level", config.log_level);
        read_value(root, "use_journald", config.use_journald);

        YAML::Node transport = root["transport"];
        read_value(transport, "max_frame_bytes", config.max_frame_bytes);

        YAML::Node dispatch = root["dispatch"];
        read_value(dispatch, "workers", config.workers);
        read_value(dispatch, "shutdown_grace_ms", config.shutdown_grace_ms);
        read_value(dispatch, "max_pending", config.max_pending);

        YAML::Node auth = root["authorization"];
        read_value(auth, "request_on_start", config.request_authorization_on_start);
        read_value(auth, "required", config.authorization_required);

        YAML::Node store = root["store"];
        read_value(store, "path", config.store_path);
        read_value(store, "default_list", config.default_list);

        config.expand_paths();

        std::string error = config.validate();
        if (!error.empty()) {
            LOG_ERROR("Config", "Invalid configuration in " + path + ": " + error);
            return std::nullopt;
        }
        return config;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("Config", "Failed to parse " + path + ": " + std::string(e.what()));
        return std::nullopt;
    }
}

bool Config::save(const std::string& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "log_level" << YAML::Value << log_level;
    out << YAML::Key << "use_journald" << YAML::Value << use_journald;
    out << YAML::Key << "transport" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_frame_bytes" << YAML::Value << max_frame_bytes;
    out << YAML::EndMap;
    out << YAML::Key << "dispatch" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "workers" << YAML::Value << workers;
    out << YAML::Key << "shutdown_grace_ms" << YAML::Value << shutdown_grace_ms;
    out << YAML::Key << "max_pending" << YAML::Value << max_pending;
    out << YAML::EndMap;
    out << YAML::Key << "authorization" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "request_on_start" << YAML::Value << request_authorization_on_start;
    out << YAML::Key << "required" << YAML::Value << authorization_required;
    out << YAML::EndMap;
    out << YAML::Key << "store" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "path" << YAML::Value << store_path;
    out << YAML::Key << "default_list" << YAML::Value << default_list;
    out << YAML::EndMap;
    out << YAML::EndMap;

    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Config", "Cannot write " + path);
        return false;
    }
    file << out.c_str() << "\n";
    return file.good();
}

Config Config::defaults() {
    Config config;
    config.expand_paths();
    return config;
}

void Config::expand_paths() {
    store_path = expand_path(store_path);
}

std::string Config::validate() const {
    if (log_level < 0 || log_level > 4) {
        return "log_level must be between 0 and 4";
    }
    if (max_frame_bytes < 1024) {
        return "transport.max_frame_bytes must be at least 1024";
    }
    if (workers < 1 || workers > 64) {
        return "dispatch.workers must be between 1 and 64";
    }
    if (shutdown_grace_ms < 0) {
        return "dispatch.shutdown_grace_ms must not be negative";
    }
    if (max_pending < 1 || max_pending > 65536) {
        return "dispatch.max_pending must be between 1 and 65536";
    }
    if (store_path.empty()) {
        return "store.path must not be empty";
    }
    if (default_list.empty()) {
        return "store.default_list must not be empty";
    }
    return "";
}

json Config::to_json() const {
    return {
        {"log_level", log_level},
        {"use_journald", use_journald},
        {"transport", {{"max_frame_bytes", max_frame_bytes}}},
        {"dispatch", {
            {"workers", workers},
            {"shutdown_grace_ms", shutdown_grace_ms},
            {"max_pending", max_pending}
        }},
        {"authorization", {
            {"request_on_start", request_authorization_on_start},
            {"required", authorization_required}
        }},
        {"store", {
            {"path", store_path},
            {"default_list", default_list}
        }}
    };
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::load(const std::string& path) {
    auto loaded = Config::load(path);
    if (!loaded) {
        return false;
    }

    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = *loaded;
        config_path_ = path;
        callbacks = callbacks_;
    }

    LOG_INFO("ConfigManager", "Loaded configuration from " + path);
    notify_callbacks_unlocked(callbacks, *loaded);
    return true;
}

bool ConfigManager::load_default() {
    for (const char* candidate : {DEFAULT_CONFIG_PATH, DEFAULT_USER_CONFIG_PATH}) {
        std::string path = expand_path(candidate);
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            return load(path);
        }
    }
    LOG_INFO("ConfigManager", "No config file found, using defaults");
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = Config::defaults();
    config_path_.clear();
    return true;
}

bool ConfigManager::reload() {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = config_path_;
    }
    if (path.empty()) {
        LOG_WARN("ConfigManager", "No config file loaded, nothing to reload");
        return false;
    }
    return load(path);
}

Config ConfigManager::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::string ConfigManager::path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_path_;
}

void ConfigManager::on_change(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = Config::defaults();
    config_path_.clear();
    callbacks_.clear();
}

void ConfigManager::notify_callbacks_unlocked(
    const std::vector<ChangeCallback>& callbacks,
    const Config& config) {
    for (const auto& callback : callbacks) {
        try {
            callback(config);
        } catch (const std::exception& e) {
            LOG_ERROR("ConfigManager", "Config change callback failed: " + std::string(e.what()));
        }
    }
}

} // namespace remindd
