#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace hubsync {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing hubsync" << (config_.runtime.name.empty() ? "" : " (" + config_.runtime.name + ")"));

    if (!init_core_services(error)) {
        return false;
    }

    // Prime the snapshot once so initial HTTP calls observe a full device list.
    // A failure here is not fatal: the poll thread keeps retrying.
    auto result = coordinator_->refresh();
    if (result.success) {
        LOG_INFO("[Runtime] Initial snapshot: " << result.device_count << " devices");
    } else {
        LOG_WARN("[Runtime] Initial refresh failed: " << result.error_message);
    }

    return init_http(error);
}

bool Runtime::init_core_services(std::string &error) {
    event_emitter_ = std::make_shared<events::EventEmitter>();

    hub_client_ = std::make_unique<hub::BridgeClient>(config_.hub);
    if (!hub_client_->start()) {
        error = "Hub bridge failed to start: " + hub_client_->last_error();
        return false;
    }
    const std::string hub_id = hub_client_->hub_id();
    LOG_INFO("[Runtime] Hub bridge ready" << (hub_id.empty() ? "" : " (hub " + hub_id + ")"));

    store_ = std::make_unique<state::SnapshotStore>();
    coordinator_ =
        std::make_unique<sync::Coordinator>(*hub_client_, *store_, config_.polling, config_.push, config_.query);
    coordinator_->set_event_emitter(event_emitter_);
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (!config_.http.enabled) {
        LOG_INFO("[Runtime] HTTP server disabled");
        return true;
    }

    http_server_ = std::make_unique<http::HttpServer>(config_.http, *coordinator_, event_emitter_,
                                                      config_.hub.command_timeout_ms, config_.runtime.name);
    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    coordinator_->start();

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Shutting down");
    coordinator_->stop();
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (coordinator_) {
        coordinator_->stop();
    }

    if (hub_client_) {
        LOG_INFO("[Runtime] Stopping hub bridge");
        hub_client_->shutdown();
    }
}

}  // namespace runtime
}  // namespace hubsync
