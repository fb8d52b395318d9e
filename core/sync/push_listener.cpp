#include "push_listener.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

#include "logging/logger.hpp"

namespace hubsync {
namespace sync {

int compute_backoff_ms(const ReconnectPolicy &policy, int retry) {
    if (retry < 1 || policy.base_backoff_ms <= 0) {
        return 0;
    }
    const int shift = retry - 1 > 30 ? 30 : retry - 1;
    const int64_t delay = static_cast<int64_t>(policy.base_backoff_ms) << shift;
    return delay > kMaxBackoffMs ? kMaxBackoffMs : static_cast<int>(delay);
}

const char *state_to_string(PushListener::State state) {
    switch (state) {
        case PushListener::State::STOPPED:
            return "STOPPED";
        case PushListener::State::CONNECTING:
            return "CONNECTING";
        case PushListener::State::LISTENING:
            return "LISTENING";
        case PushListener::State::BACKOFF:
            return "BACKOFF";
        case PushListener::State::GIVEN_UP:
            return "GIVEN_UP";
    }
    return "STOPPED";
}

PushListener::PushListener(hub::IHubClient &client, state::SnapshotStore &store, const ReconnectPolicy &policy)
    : client_(client), store_(store), policy_(policy) {
    stats_.max_retries = policy.max_retries;
}

PushListener::~PushListener() { stop(); }

bool PushListener::start() {
    if (running_.load(std::memory_order_acquire)) {
        return false;
    }

    // Reap a thread that already exited (gave up)
    if (thread_.joinable()) {
        thread_.join();
    }

    stop_requested_.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.retry_count = 0;
        stats_.last_backoff_ms = 0;
        stats_.state = State::CONNECTING;
        stats_.running = true;
    }
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&PushListener::run, this);

    LOG_INFO("[PushListener] Started");
    return true;
}

void PushListener::restart() {
    stop();
    start();
}

void PushListener::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_.store(true, std::memory_order_release);
    }
    stop_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

PushListener::Snapshot PushListener::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Snapshot copy = stats_;
    copy.running = running_.load(std::memory_order_acquire);
    return copy;
}

void PushListener::set_state(State state) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.state = state;
}

void PushListener::run() {
    while (!stop_requested_.load(std::memory_order_acquire)) {
        set_state(State::CONNECTING);

        // id -> name, for log lines only; merges go through the store index
        std::unordered_map<std::string, std::string> names;
        for (const auto &device : store_.read()) {
            names.emplace(device.me(), device.name());
        }
        LOG_DEBUG("[PushListener] Connecting (" << names.size() << " known devices)");

        set_state(State::LISTENING);
        if (listen(names)) {
            break;  // stop requested
        }

        const int retry = snapshot().retry_count + 1;
        const std::string error = client_.last_error();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.retry_count = retry;
            stats_.last_error = error;
        }

        if (retry >= policy_.max_retries) {
            LOG_ERROR("[PushListener] Giving up after " << retry << " consecutive failures: " << error);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.state = State::GIVEN_UP;
                stats_.give_up_count++;
            }
            if (give_up_handler_) {
                give_up_handler_();
            }
            break;
        }

        set_state(State::BACKOFF);
        client_.reset_connection();

        const int backoff_ms = compute_backoff_ms(policy_, retry);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.last_backoff_ms = backoff_ms;
        }
        LOG_WARN("[PushListener] Stream failed (" << error << "), retry " << retry << "/" << policy_.max_retries
                                                  << " in " << backoff_ms << "ms");

        if (!wait_backoff(backoff_ms)) {
            break;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        stats_.reconnect_count++;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.state = State::STOPPED;
        stats_.running = false;
    }
    client_.release_thread_state();
    running_.store(false, std::memory_order_release);
    LOG_INFO("[PushListener] Stopped");
}

bool PushListener::listen(const std::unordered_map<std::string, std::string> &names) {
    while (!stop_requested_.load(std::memory_order_acquire)) {
        std::optional<bridge::v1::StateUpdate> update;
        if (!client_.next_state_update(policy_.wait_ms, update)) {
            return false;
        }
        if (!update) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.retry_count = 0;
            stats_.events_received++;
        }
        apply(*update, names);
    }
    return true;
}

void PushListener::apply(const bridge::v1::StateUpdate &update,
                         const std::unordered_map<std::string, std::string> &names) {
    const bool applied = store_.merge_delta(update);

    if (applied) {
        auto it = names.find(update.me());
        LOG_DEBUG("[PushListener] " << (it != names.end() && !it->second.empty() ? it->second : update.me()) << " "
                                    << update.idx() << " updated");
    } else {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.events_dropped++;
        }
        LOG_DEBUG("[PushListener] Dropping update " << update.me() << "/" << update.idx()
                                                     << " (unknown device or malformed event)");
    }

    if (update_handler_) {
        update_handler_(update, applied);
    }
}

bool PushListener::wait_backoff(int backoff_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !stop_cv_.wait_for(lock, std::chrono::milliseconds(backoff_ms),
                              [this] { return stop_requested_.load(std::memory_order_acquire); });
}

}  // namespace sync
}  // namespace hubsync
