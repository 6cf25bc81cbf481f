#pragma once

#include <string>
#include <vector>

#include "vendor/vendor_config.hpp"

namespace micsync {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

// Runtime section configuration (runtime: in YAML)
struct RuntimeModeConfig {
    std::string name = "micsync";    // Instance identifier, used in log lines and status
    int shutdown_timeout_ms = 5000;  // Max wait for in-flight passes on shutdown (500-60000ms)
};

struct HttpConfig {
    bool enabled = true;             // Status server enabled
    std::string bind = "127.0.0.1";  // Bind address
    int port = 8090;                 // HTTP port
    int thread_pool_size = 8;        // Worker thread pool size
};

struct StoreConfig {
    int rate_limit_ttl_ms = 60000;  // Expiry of rate-limit entries
    int progress_ttl_ms = 3600000;  // Expiry of scan progress records
};

struct DiscoveryConfig {
    bool enabled = true;                  // Periodic passes; --once ignores this
    int interval_ms = 300000;             // Delay between passes per vendor
    std::vector<std::string> scan_cidrs;  // Applied to every vendor
    std::vector<std::string> scan_fqdns;  // Applied to every vendor
    int max_hosts = 1024;                 // Host cap per CIDR
    int workers = 2;                      // Concurrent passes
    std::string progress_topic = "discovery.progress";
};

struct RuntimeConfig {
    RuntimeModeConfig runtime;
    HttpConfig http;
    LoggingConfig logging;
    StoreConfig store;
    DiscoveryConfig discovery;
    std::vector<vendor::VendorConfig> vendors;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Same as load_config() for YAML text already in memory
bool load_config_from_string(const std::string &yaml_text, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace micsync
