#pragma once

#include <string>
#include <vector>

#include "../hub/bridge_config.hpp"

namespace hubsync {
namespace runtime {

// Runtime section configuration (runtime: in YAML)
struct RuntimeModeConfig {
    std::string name;  // Instance identifier (optional, shows up in logs and /v0/runtime/status)
};

// Full-state poll (polling: in YAML)
struct PollingConfig {
    int interval_ms = 30000;        // Scheduled refresh period
    int max_attempts = 3;           // Attempts per refresh; only timeouts are retried
    int attempt_timeout_ms = 1000;  // Bound on one discover_devices call
    int retry_delay_ms = 1000;      // Pause between timed-out attempts
};

// Push stream supervision (push: in YAML)
struct PushConfig {
    bool enabled = true;
    int max_retries = 5;         // Consecutive stream failures before the listener gives up
    int base_backoff_ms = 1000;  // Reconnect delay base; doubles per consecutive failure
    int wait_ms = 500;           // Bound on one stream wait
};

// Single-device detail query (query: in YAML)
struct QueryConfig {
    int max_attempts = 3;
    int timeout_ms = 1000;
    int retry_delay_ms = 1000;
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 16;                           // Worker thread pool size
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    RuntimeModeConfig runtime;
    hub::BridgeConfig hub;
    PollingConfig polling;
    PushConfig push;
    QueryConfig query;
    HttpConfig http;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace hubsync
