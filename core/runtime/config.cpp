#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <set>
#include <sstream>

#include "../logging/logger.hpp"

namespace micsync {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::vector<std::string> &valid_keys, const std::string &where) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        const std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            LOG_WARN("[Config] Unknown key: '" << where << key << "' (will be ignored)");
        }
    }
}

std::vector<std::string> as_string_list(const YAML::Node &node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto &item : node) {
            out.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
    return out;
}

// Value from the named environment variable, if config left the field empty
void fill_from_env(std::string &field, const YAML::Node &env_name_node) {
    if (!field.empty() || !env_name_node) {
        return;
    }
    const std::string env_name = env_name_node.as<std::string>();
    const char *value = std::getenv(env_name.c_str());
    if (value != nullptr) {
        field = value;
    } else {
        LOG_WARN("[Config] Environment variable '" << env_name << "' is not set");
    }
}

bool parse_vendor(const YAML::Node &node, vendor::VendorConfig &vendor, std::string &error) {
    if (!node.IsMap()) {
        error = "Each vendor entry must be a mapping";
        return false;
    }

    if (node["id"]) {
        vendor.id = node["id"].as<std::string>();
    }
    warn_unknown_keys(node,
                      {"id", "type", "base_url", "credentials", "timeout_ms", "max_retries", "backoff_factor",
                       "retry_status_codes", "verify_tls", "failure_threshold", "recovery_timeout_ms", "rate_limits",
                       "cidrs", "fqdns"},
                      "vendors[" + vendor.id + "].");

    if (node["type"]) {
        vendor.type = node["type"].as<std::string>();
    }
    if (node["base_url"]) {
        vendor.base_url = node["base_url"].as<std::string>();
    }

    // Credentials: literal values win over *_env indirections
    if (node["credentials"]) {
        const auto &creds = node["credentials"];
        warn_unknown_keys(creds, {"api_key", "api_key_env", "username", "password", "password_env"},
                          "vendors[" + vendor.id + "].credentials.");
        if (creds["api_key"]) {
            vendor.credentials.api_key = creds["api_key"].as<std::string>();
        }
        if (creds["username"]) {
            vendor.credentials.username = creds["username"].as<std::string>();
        }
        if (creds["password"]) {
            vendor.credentials.password = creds["password"].as<std::string>();
        }
        fill_from_env(vendor.credentials.api_key, creds["api_key_env"]);
        fill_from_env(vendor.credentials.password, creds["password_env"]);
    }

    if (node["timeout_ms"]) {
        vendor.timeout_ms = node["timeout_ms"].as<int>();
    }
    if (node["max_retries"]) {
        vendor.max_retries = node["max_retries"].as<int>();
    }
    if (node["backoff_factor"]) {
        vendor.backoff_factor = node["backoff_factor"].as<double>();
    }
    if (node["retry_status_codes"]) {
        vendor.retry_status_codes.clear();
        for (const auto &code : node["retry_status_codes"]) {
            vendor.retry_status_codes.insert(code.as<int>());
        }
    }
    if (node["verify_tls"]) {
        vendor.verify_tls = node["verify_tls"].as<bool>();
    }
    if (node["failure_threshold"]) {
        vendor.failure_threshold = node["failure_threshold"].as<int>();
    }
    if (node["recovery_timeout_ms"]) {
        vendor.recovery_timeout_ms = node["recovery_timeout_ms"].as<int>();
    }

    if (node["rate_limits"]) {
        const auto &rl = node["rate_limits"];
        warn_unknown_keys(rl, {"list_devices", "device_detail", "discovery"},
                          "vendors[" + vendor.id + "].rate_limits.");
        if (rl["list_devices"]) {
            vendor.rate_limits.list_devices = rl["list_devices"].as<double>();
        }
        if (rl["device_detail"]) {
            vendor.rate_limits.device_detail = rl["device_detail"].as<double>();
        }
        if (rl["discovery"]) {
            vendor.rate_limits.discovery = rl["discovery"].as<double>();
        }
    }

    if (node["cidrs"]) {
        vendor.cidrs = as_string_list(node["cidrs"]);
    }
    if (node["fqdns"]) {
        vendor.fqdns = as_string_list(node["fqdns"]);
    }
    return true;
}

bool parse_config(const YAML::Node &yaml, RuntimeConfig &config, std::string &error) {
    if (!yaml.IsMap()) {
        error = "Config root must be a mapping";
        return false;
    }

    // Check for unknown top-level keys
    warn_unknown_keys(yaml, {"runtime", "http", "logging", "store", "discovery", "vendors"}, "");

    // Load runtime section
    if (yaml["runtime"]) {
        if (yaml["runtime"]["name"]) {
            config.runtime.name = yaml["runtime"]["name"].as<std::string>();
        }
        if (yaml["runtime"]["shutdown_timeout_ms"]) {
            config.runtime.shutdown_timeout_ms = yaml["runtime"]["shutdown_timeout_ms"].as<int>();
        }
    }

    // Load HTTP config
    if (yaml["http"]) {
        if (yaml["http"]["enabled"]) {
            config.http.enabled = yaml["http"]["enabled"].as<bool>();
        }
        if (yaml["http"]["bind"]) {
            config.http.bind = yaml["http"]["bind"].as<std::string>();
        }
        if (yaml["http"]["port"]) {
            config.http.port = yaml["http"]["port"].as<int>();
        }
        if (yaml["http"]["thread_pool_size"]) {
            config.http.thread_pool_size = yaml["http"]["thread_pool_size"].as<int>();
        }
    }

    // Load logging config
    if (yaml["logging"]) {
        if (yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }
    }

    // Load store config
    if (yaml["store"]) {
        if (yaml["store"]["rate_limit_ttl_ms"]) {
            config.store.rate_limit_ttl_ms = yaml["store"]["rate_limit_ttl_ms"].as<int>();
        }
        if (yaml["store"]["progress_ttl_ms"]) {
            config.store.progress_ttl_ms = yaml["store"]["progress_ttl_ms"].as<int>();
        }
    }

    // Load discovery config
    if (yaml["discovery"]) {
        const auto &d = yaml["discovery"];
        if (d["enabled"]) {
            config.discovery.enabled = d["enabled"].as<bool>();
        }
        if (d["interval_ms"]) {
            config.discovery.interval_ms = d["interval_ms"].as<int>();
        }
        if (d["scan_cidrs"]) {
            config.discovery.scan_cidrs = as_string_list(d["scan_cidrs"]);
        }
        if (d["scan_fqdns"]) {
            config.discovery.scan_fqdns = as_string_list(d["scan_fqdns"]);
        }
        if (d["max_hosts"]) {
            config.discovery.max_hosts = d["max_hosts"].as<int>();
        }
        if (d["workers"]) {
            config.discovery.workers = d["workers"].as<int>();
        }
        if (d["progress_topic"]) {
            config.discovery.progress_topic = d["progress_topic"].as<std::string>();
        }
    }

    // Load vendors
    if (yaml["vendors"]) {
        config.vendors.clear();  // Ensure idempotent parsing
        for (const auto &vendor_node : yaml["vendors"]) {
            vendor::VendorConfig vendor;
            if (!parse_vendor(vendor_node, vendor, error)) {
                return false;
            }
            config.vendors.push_back(vendor);
        }
    }

    if (!validate_config(config, error)) {
        return false;
    }

    LOG_INFO("[Config] Loaded " << config.vendors.size() << " vendor(s)");

    std::stringstream http_msg;
    http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
    if (config.http.enabled) {
        http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
    }
    LOG_INFO(http_msg.str());

    std::stringstream discovery_msg;
    discovery_msg << "[Config] Discovery: " << (config.discovery.enabled ? "enabled" : "disabled");
    if (config.discovery.enabled) {
        discovery_msg << " (every " << config.discovery.interval_ms << "ms, " << config.discovery.scan_cidrs.size()
                      << " CIDR(s), " << config.discovery.scan_fqdns.size() << " FQDN(s))";
    }
    LOG_INFO(discovery_msg.str());

    LOG_INFO("[Config] Log level: " << config.logging.level);
    return true;
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate runtime settings
    if (config.runtime.shutdown_timeout_ms < 500 || config.runtime.shutdown_timeout_ms > 60000) {
        error = "runtime.shutdown_timeout_ms must be between 500 and 60000";
        return false;
    }

    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
    }

    // Validate Logging settings
    const std::set<std::string> levels = {"debug", "info", "warn", "error"};
    if (levels.count(config.logging.level) == 0) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    // Validate store settings
    if (config.store.rate_limit_ttl_ms < 1000) {
        error = "store.rate_limit_ttl_ms must be >= 1000ms";
        return false;
    }
    if (config.store.progress_ttl_ms < 1000) {
        error = "store.progress_ttl_ms must be >= 1000ms";
        return false;
    }

    // Validate discovery settings
    if (config.discovery.interval_ms < 1000) {
        error = "discovery.interval_ms must be >= 1000ms";
        return false;
    }
    if (config.discovery.max_hosts < 1 || config.discovery.max_hosts > 65536) {
        error = "discovery.max_hosts must be between 1 and 65536";
        return false;
    }
    if (config.discovery.workers < 1) {
        error = "discovery.workers must be at least 1";
        return false;
    }
    if (config.discovery.progress_topic.empty()) {
        error = "discovery.progress_topic must not be empty";
        return false;
    }

    // Validate vendor settings
    if (config.vendors.empty()) {
        error = "Config must specify at least one vendor";
        return false;
    }

    std::set<std::string> seen_ids;
    for (const auto &vendor : config.vendors) {
        if (vendor.id.empty()) {
            error = "Vendor missing 'id' field";
            return false;
        }
        if (!seen_ids.insert(vendor.id).second) {
            error = "Duplicate vendor id '" + vendor.id + "'";
            return false;
        }
        if (vendor.type.empty()) {
            error = "Vendor '" + vendor.id + "' missing 'type' field";
            return false;
        }
        if (vendor.base_url.rfind("http://", 0) != 0 && vendor.base_url.rfind("https://", 0) != 0) {
            error = "Vendor '" + vendor.id + "' base_url must start with http:// or https://";
            return false;
        }
        if (vendor.timeout_ms < 100) {
            error = "Vendor '" + vendor.id + "' timeout_ms must be >= 100ms";
            return false;
        }
        if (vendor.max_retries < 0 || vendor.max_retries > 10) {
            error = "Vendor '" + vendor.id + "' max_retries must be between 0 and 10";
            return false;
        }
        if (vendor.backoff_factor < 0.0) {
            error = "Vendor '" + vendor.id + "' backoff_factor must be >= 0";
            return false;
        }
        for (int code : vendor.retry_status_codes) {
            if (code < 100 || code > 599) {
                error = "Vendor '" + vendor.id + "' has invalid retry status code " + std::to_string(code);
                return false;
            }
        }
        if (vendor.failure_threshold < 1) {
            error = "Vendor '" + vendor.id + "' failure_threshold must be >= 1";
            return false;
        }
        if (vendor.recovery_timeout_ms < 0) {
            error = "Vendor '" + vendor.id + "' recovery_timeout_ms must be >= 0";
            return false;
        }
        if (vendor.rate_limits.list_devices < 0.0 || vendor.rate_limits.device_detail < 0.0 ||
            vendor.rate_limits.discovery < 0.0) {
            error = "Vendor '" + vendor.id + "' rate limits must be >= 0";
            return false;
        }
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        return parse_config(yaml, config, error);
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool load_config_from_string(const std::string &yaml_text, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::Load(yaml_text);
        return parse_config(yaml, config, error);
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace micsync
