// micsync runtime
// Keeps vendor discovery lists in sync with configured scan targets

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: micsync-runtime [OPTIONS]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH    Path to config file (default: micsync.yaml)\n";
    std::cerr << "  --once           Run one reconcile pass per vendor and exit\n";
    std::cerr << "  --help, -h       Show this help\n";
}

}  // namespace

int main(int argc, char **argv) {
    std::string config_path = "micsync.yaml";
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Logger level is not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("micsync runtime starting...");
    LOG_INFO("Loading config: " << config_path);

    micsync::runtime::RuntimeConfig config;
    std::string error;

    if (!micsync::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    micsync::logging::Logger::set_level(micsync::logging::string_to_level(config.logging.level));

    micsync::runtime::SignalHandler::install();

    micsync::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Instance: " << config.runtime.name);
    LOG_INFO("  Vendors: " << runtime.get_vendor_registry().adapter_count() << "/" << config.vendors.size());
    LOG_INFO("  Interval: " << config.discovery.interval_ms << "ms");

    int exit_code = 0;
    if (once) {
        if (!runtime.run_once()) {
            LOG_ERROR("One or more passes failed");
            exit_code = 2;
        }
    } else {
        runtime.run();
    }

    runtime.shutdown();
    LOG_INFO("Shutdown complete");
    return exit_code;
}
