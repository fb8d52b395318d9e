#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "events/event_emitter.hpp"
#include "http/server.hpp"
#include "hub/bridge_client.hpp"
#include "state/snapshot_store.hpp"
#include "sync/coordinator.hpp"

namespace hubsync {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Start the hub bridge, prime the snapshot, start HTTP
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop HTTP, the coordinator and the bridge sessions. Idempotent.
    void shutdown();

    sync::Coordinator &get_coordinator() { return *coordinator_; }
    events::EventEmitter &get_event_emitter() { return *event_emitter_; }

private:
    bool init_core_services(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<hub::BridgeClient> hub_client_;
    std::unique_ptr<state::SnapshotStore> store_;
    std::shared_ptr<events::EventEmitter> event_emitter_;  // Shared with Coordinator + HTTP
    std::unique_ptr<sync::Coordinator> coordinator_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace hubsync
