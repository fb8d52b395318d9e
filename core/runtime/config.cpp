#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <set>
#include <vector>

#include "../logging/logger.hpp"

namespace hubsync {
namespace runtime {

namespace {
constexpr int kMinTimeoutMs = 100;
constexpr int kMinPollIntervalMs = 1000;

// Copies node[key] into target when present
template <typename T>
void load_scalar(const YAML::Node &node, const char *key, T &target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

bool check_timeout(const char *name, int value, std::string &error) {
    if (value < kMinTimeoutMs) {
        error = std::string(name) + " must be >= " + std::to_string(kMinTimeoutMs) + "ms";
        return false;
    }
    return true;
}
}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Hub bridge
    if (config.hub.command.empty()) {
        error = "hub.command must be set (path to the hub bridge executable)";
        return false;
    }
    if (!check_timeout("hub.timeout_ms", config.hub.timeout_ms, error) ||
        !check_timeout("hub.hello_timeout_ms", config.hub.hello_timeout_ms, error) ||
        !check_timeout("hub.command_timeout_ms", config.hub.command_timeout_ms, error) ||
        !check_timeout("hub.shutdown_timeout_ms", config.hub.shutdown_timeout_ms, error)) {
        return false;
    }

    // Polling
    if (config.polling.interval_ms < kMinPollIntervalMs) {
        error = "polling.interval_ms must be >= " + std::to_string(kMinPollIntervalMs) + "ms";
        return false;
    }
    if (config.polling.max_attempts < 1) {
        error = "polling.max_attempts must be >= 1";
        return false;
    }
    if (!check_timeout("polling.attempt_timeout_ms", config.polling.attempt_timeout_ms, error)) {
        return false;
    }
    if (config.polling.retry_delay_ms < 0) {
        error = "polling.retry_delay_ms must be >= 0";
        return false;
    }

    // Push
    if (config.push.enabled) {
        if (config.push.max_retries < 1) {
            error = "push.max_retries must be >= 1";
            return false;
        }
        if (config.push.base_backoff_ms < 0) {
            error = "push.base_backoff_ms must be >= 0";
            return false;
        }
        if (!check_timeout("push.wait_ms", config.push.wait_ms, error)) {
            return false;
        }
    }

    // Query
    if (config.query.max_attempts < 1) {
        error = "query.max_attempts must be >= 1";
        return false;
    }
    if (!check_timeout("query.timeout_ms", config.query.timeout_ms, error)) {
        return false;
    }
    if (config.query.retry_delay_ms < 0) {
        error = "query.retry_delay_ms must be >= 0";
        return false;
    }

    // HTTP
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
    }

    // Logging
    static const std::set<std::string> kLevels = {"debug", "info", "warn", "error"};
    if (kLevels.count(config.logging.level) == 0) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

namespace {

const std::set<std::string> kSections = {"runtime", "hub", "polling", "push", "query", "http", "logging"};

std::vector<std::string> load_string_list(const YAML::Node &node) {
    std::vector<std::string> out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else {
        for (const auto &item : node) {
            out.push_back(item.as<std::string>());
        }
    }
    return out;
}

void load_hub(const YAML::Node &node, hub::BridgeConfig &hub) {
    load_scalar(node, "command", hub.command);
    if (node["args"]) {
        hub.args = load_string_list(node["args"]);
    }
    load_scalar(node, "timeout_ms", hub.timeout_ms);
    load_scalar(node, "hello_timeout_ms", hub.hello_timeout_ms);
    load_scalar(node, "command_timeout_ms", hub.command_timeout_ms);
    load_scalar(node, "shutdown_timeout_ms", hub.shutdown_timeout_ms);
}

void load_polling(const YAML::Node &node, PollingConfig &polling) {
    load_scalar(node, "interval_ms", polling.interval_ms);
    load_scalar(node, "max_attempts", polling.max_attempts);
    load_scalar(node, "attempt_timeout_ms", polling.attempt_timeout_ms);
    load_scalar(node, "retry_delay_ms", polling.retry_delay_ms);
}

void load_push(const YAML::Node &node, PushConfig &push) {
    load_scalar(node, "enabled", push.enabled);
    load_scalar(node, "max_retries", push.max_retries);
    load_scalar(node, "base_backoff_ms", push.base_backoff_ms);
    load_scalar(node, "wait_ms", push.wait_ms);
}

void load_query(const YAML::Node &node, QueryConfig &query) {
    load_scalar(node, "max_attempts", query.max_attempts);
    load_scalar(node, "timeout_ms", query.timeout_ms);
    load_scalar(node, "retry_delay_ms", query.retry_delay_ms);
}

void load_http(const YAML::Node &node, HttpConfig &http) {
    load_scalar(node, "enabled", http.enabled);
    load_scalar(node, "bind", http.bind);
    load_scalar(node, "port", http.port);
    // A single origin may be given as a plain string
    if (node["cors_allowed_origins"]) {
        http.cors_allowed_origins = load_string_list(node["cors_allowed_origins"]);
    }
    load_scalar(node, "cors_allow_credentials", http.cors_allow_credentials);
    load_scalar(node, "thread_pool_size", http.thread_pool_size);
}

void log_summary(const RuntimeConfig &config) {
    LOG_INFO("[Config] Runtime '" << config.runtime.name << "', bridge " << config.hub.command << " ("
                                  << config.hub.args.size() << " args)");
    LOG_INFO("[Config] Poll every " << config.polling.interval_ms << "ms, " << config.polling.max_attempts
                                    << " attempts of " << config.polling.attempt_timeout_ms << "ms");
    if (config.push.enabled) {
        LOG_INFO("[Config] Push listener on (max_retries " << config.push.max_retries << ", base backoff "
                                                          << config.push.base_backoff_ms << "ms)");
    } else {
        LOG_INFO("[Config] Push listener off");
    }
    if (config.http.enabled) {
        LOG_INFO("[Config] HTTP on " << config.http.bind << ":" << config.http.port);
    } else {
        LOG_INFO("[Config] HTTP off");
    }
}

}  // namespace

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::BadFile &) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    }

    try {
        for (const auto &entry : root) {
            const auto section = entry.first.as<std::string>();
            if (kSections.count(section) == 0) {
                LOG_WARN("[Config] Ignoring unknown section '" << section << "'");
            }
        }

        if (root["runtime"]) {
            load_scalar(root["runtime"], "name", config.runtime.name);
        }
        if (root["hub"]) {
            load_hub(root["hub"], config.hub);
        }
        if (root["polling"]) {
            load_polling(root["polling"], config.polling);
        }
        if (root["push"]) {
            load_push(root["push"], config.push);
        }
        if (root["query"]) {
            load_query(root["query"], config.query);
        }
        if (root["http"]) {
            load_http(root["http"], config.http);
        }
        if (root["logging"]) {
            load_scalar(root["logging"], "level", config.logging.level);
        }
    } catch (const YAML::Exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }

    if (!validate_config(config, error)) {
        return false;
    }
    log_summary(config);
    return true;
}

}  // namespace runtime
}  // namespace hubsync
