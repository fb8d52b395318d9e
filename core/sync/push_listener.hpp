#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "bridge.pb.h"
#include "hub/i_hub_client.hpp"
#include "state/snapshot_store.hpp"

namespace hubsync {
namespace sync {

struct ReconnectPolicy {
    int max_retries = 5;         // consecutive failures before giving up
    int base_backoff_ms = 1000;  // first backoff; doubles per retry
    int wait_ms = 500;           // bound on one stream wait, keeps stop() responsive
};

// Upper bound on one backoff wait (1 hour)
constexpr int kMaxBackoffMs = 60 * 60 * 1000;

// Backoff before reconnect attempt `retry` (1-based): base * 2^(retry-1), capped at kMaxBackoffMs
int compute_backoff_ms(const ReconnectPolicy &policy, int retry);

// PushListener - applies the hub's push stream to the snapshot store on its own thread.
//
// States: STOPPED -> CONNECTING -> LISTENING -> (error) BACKOFF -> CONNECTING ...
// A received event resets the retry counter. When the retry counter reaches
// max_retries the listener gives up: the give-up handler runs and the thread exits
// without another reconnect. Restarting a stopped listener is the owner's decision.
class PushListener {
public:
    enum class State { STOPPED, CONNECTING, LISTENING, BACKOFF, GIVEN_UP };

    // Immutable view of listener state for cross-thread reads
    struct Snapshot {
        State state = State::STOPPED;
        bool running = false;
        int retry_count = 0;
        int max_retries = 0;
        int last_backoff_ms = 0;
        uint64_t reconnect_count = 0;
        uint64_t events_received = 0;
        uint64_t events_dropped = 0;  // deltas for devices not in the snapshot
        uint64_t give_up_count = 0;
        std::string last_error;
    };

    // Called after each received event; applied is false when the device was unknown
    using UpdateHandler = std::function<void(const bridge::v1::StateUpdate &update, bool applied)>;
    using GiveUpHandler = std::function<void()>;

    PushListener(hub::IHubClient &client, state::SnapshotStore &store, const ReconnectPolicy &policy);
    ~PushListener();

    PushListener(const PushListener &) = delete;
    PushListener &operator=(const PushListener &) = delete;

    // Handlers must be set before start()
    void set_update_handler(UpdateHandler handler) { update_handler_ = std::move(handler); }
    void set_give_up_handler(GiveUpHandler handler) { give_up_handler_ = std::move(handler); }

    // Starts the listener thread. Returns false if it is already running.
    bool start();

    // Stops the current thread (if any) and starts a fresh one with a zero retry count
    void restart();

    // Wakes any backoff wait and joins the thread. Idempotent.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    Snapshot snapshot() const;

private:
    hub::IHubClient &client_;
    state::SnapshotStore &store_;
    ReconnectPolicy policy_;
    UpdateHandler update_handler_;
    GiveUpHandler give_up_handler_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    Snapshot stats_;

    void run();
    void set_state(State state);
    bool listen(const std::unordered_map<std::string, std::string> &names);
    void apply(const bridge::v1::StateUpdate &update, const std::unordered_map<std::string, std::string> &names);

    // Returns false when stop was requested during the wait
    bool wait_backoff(int backoff_ms);
};

const char *state_to_string(PushListener::State state);

}  // namespace sync
}  // namespace hubsync
