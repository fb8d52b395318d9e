#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "bridge.pb.h"
#include "hub/i_hub_client.hpp"
#include "push_listener.hpp"
#include "runtime/config.hpp"
#include "state/snapshot_store.hpp"

namespace hubsync {

namespace events {
class EventEmitter;
}

namespace sync {

constexpr int kDefaultCommandTimeoutMs = 2000;

// Outcome of one full refresh
struct SyncResult {
    bool success = false;
    std::string error_message;
    bridge::v1::Status_Code status_code = bridge::v1::Status_Code_CODE_OK;
    int attempts = 0;
    size_t device_count = 0;
};

// Outcome of a single-device detail query ({"devices": [...]})
struct DeviceQueryResult {
    bool success = false;
    std::string error_message;
    bridge::v1::Status_Code status_code = bridge::v1::Status_Code_CODE_OK;
    std::vector<bridge::v1::Device> devices;
};

// Outcome of a device write. changed is false for the no-op taken while unavailable.
struct CommandResult {
    bool success = false;
    bool changed = false;
    std::string error_message;
    bridge::v1::Status_Code status_code = bridge::v1::Status_Code_CODE_OK;
    int hub_code = 0;
    std::string hub_msg;
};

// Coordinator - owns the sync state: snapshot store, availability flag, poll thread
// and push listener. The only component consumers talk to.
//
// Threads: the poll thread runs refresh() every polling interval (or when woken by
// request_refresh()); the push listener runs on its own thread; reads and commands
// arrive from HTTP workers.
class Coordinator {
public:
    Coordinator(hub::IHubClient &client, state::SnapshotStore &store, const runtime::PollingConfig &polling,
                const runtime::PushConfig &push, const runtime::QueryConfig &query);
    ~Coordinator();

    Coordinator(const Coordinator &) = delete;
    Coordinator &operator=(const Coordinator &) = delete;

    /**
     * @brief Set event emitter for change notifications
     *
     * Must be called before start() and before the first refresh().
     */
    void set_event_emitter(const std::shared_ptr<events::EventEmitter> &emitter);

    // Start the poll thread (first tick runs after one interval; prime with refresh())
    void start();

    // Stop the poll thread and the push listener. Idempotent.
    void stop();

    // One poll tick: ensure the listener runs, fetch the full list, replace the store
    SyncResult refresh();

    // Wake the poll thread for an immediate tick. Never blocks.
    void request_refresh();

    bool available() const { return available_.load(std::memory_order_acquire); }

    // Read API - copies of the current snapshot
    std::vector<bridge::v1::Device> get_devices() const;
    std::optional<bridge::v1::Device> get_device(const std::string &device_id) const;
    std::optional<state::DeviceInfo> get_device_info(const std::string &device_id) const;

    // Detail query, serialized system wide. Does not write the store.
    // timeout_ms <= 0 uses query.timeout_ms.
    DeviceQueryResult get_device_data(const std::string &device_id, int timeout_ms = 0);

    // Device write gated by availability. timeout_ms <= 0 uses kDefaultCommandTimeoutMs.
    CommandResult set_device_state(const std::string &device_id, const hub::DeviceCommand &command,
                                   int timeout_ms = 0);

    // Listener state; a default snapshot (STOPPED) when push is disabled
    PushListener::Snapshot listener_snapshot() const;

    SyncResult last_sync_result() const;
    uint64_t store_generation() const { return store_.generation(); }
    size_t device_count() const { return store_.device_count(); }
    const runtime::PollingConfig &polling_config() const { return polling_; }
    bool push_enabled() const { return push_.enabled; }

private:
    hub::IHubClient &client_;
    state::SnapshotStore &store_;
    runtime::PollingConfig polling_;
    runtime::PushConfig push_;
    runtime::QueryConfig query_;

    std::shared_ptr<events::EventEmitter> event_emitter_;

    std::atomic<bool> available_{true};

    mutable std::mutex listener_mutex_;
    std::unique_ptr<PushListener> listener_;

    // Single-flight lock of the query path
    std::mutex query_mutex_;

    // Serializes refresh() between the poll thread and direct callers
    std::mutex refresh_mutex_;
    mutable std::mutex result_mutex_;
    SyncResult last_sync_;

    std::thread poll_thread_;
    std::atomic<bool> polling_active_{false};
    std::atomic<bool> stopping_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool refresh_requested_ = false;

    void poll_loop();
    void ensure_listener_running();
    void on_listener_give_up();
    void on_push_update(const bridge::v1::StateUpdate &update, bool applied);

    void set_available(bool available);

    // Interruptible by stop(). Returns false when stopping.
    bool sleep_for_retry(int delay_ms);

    void emit_channel_update(const bridge::v1::StateUpdate &update, const std::string &source);
};

}  // namespace sync
}  // namespace hubsync
