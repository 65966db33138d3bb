/**
 * @file main.cpp
 * @brief remindd entry point
 */

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include "remindd/common.h"
#include "remindd/config.h"
#include "remindd/logger.h"
#include "remindd/core/daemon.h"
#include "remindd/provider/local_store.h"

using namespace remindd;

namespace {

// stdout carries protocol frames; everything human-readable goes to stderr
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n\n"
              << "Reminder tool server speaking JSON-RPC 2.0 over stdin/stdout\n\n"
              << "Options:\n"
              << "  -c, --config PATH   Configuration file (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "  -v, --verbose       Enable debug logging\n"
              << "  -j, --journald      Log to the systemd journal instead of stderr\n"
              << "  -V, --version       Show version information\n"
              << "  -h, --help          Show this help message\n";
}

void print_version() {
    std::cerr << NAME << " " << VERSION << " (protocol " << PROTOCOL_VERSION << ")\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    bool verbose = false;
    bool journald = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return ExitCode::OK;
        } else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return ExitCode::OK;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-j") == 0 || strcmp(argv[i], "--journald") == 0) {
            journald = true;
        } else if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " requires a path\n";
                return ExitCode::STARTUP_PERMANENT;
            }
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return ExitCode::STARTUP_PERMANENT;
        }
    }

    Logger::init(verbose ? LogLevel::DEBUG : LogLevel::INFO, journald);

    auto& config_mgr = ConfigManager::instance();
    bool loaded = config_path.empty() ? config_mgr.load_default() : config_mgr.load(config_path);
    if (!loaded) {
        LOG_CRITICAL("main", "Invalid configuration" +
                     (config_path.empty() ? std::string() : ": " + config_path));
        Logger::shutdown();
        return ExitCode::STARTUP_PERMANENT;
    }

    Config config = config_mgr.get();
    if (!verbose) {
        Logger::set_level(Logger::level_from_int(config.log_level));
    }
    if (config.use_journald && !journald) {
        Logger::init(Logger::get_level(), true);
    }

    Daemon::install_signal_handlers();

    int exit_code;
    {
        auto provider = std::make_unique<LocalStore>(config.store_path, config.default_list);
        Daemon daemon(config, std::move(provider));
        exit_code = daemon.run();
        if (daemon.requires_immediate_exit()) {
            LOG_WARN("main", "Abandoning unfinished requests");
            Logger::shutdown();
            std::_Exit(exit_code);
        }
    }

    Logger::shutdown();
    return exit_code;
}
