#include "coordinator.hpp"

#include <google/protobuf/util/json_util.h>

#include <chrono>

#include "events/event_emitter.hpp"
#include "logging/logger.hpp"

namespace hubsync {
namespace sync {

Coordinator::Coordinator(hub::IHubClient &client, state::SnapshotStore &store, const runtime::PollingConfig &polling,
                         const runtime::PushConfig &push, const runtime::QueryConfig &query)
    : client_(client), store_(store), polling_(polling), push_(push), query_(query) {}

Coordinator::~Coordinator() { stop(); }

void Coordinator::set_event_emitter(const std::shared_ptr<events::EventEmitter> &emitter) {
    event_emitter_ = emitter;
}

//=== Poll Loop

void Coordinator::start() {
    if (polling_active_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stopping_.store(false);
        refresh_requested_ = false;
    }
    poll_thread_ = std::thread(&Coordinator::poll_loop, this);
    LOG_INFO("[Coordinator] Poll thread started (interval " << polling_.interval_ms << "ms)");
}

void Coordinator::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stopping_.store(true);
        polling_active_.store(false);
    }
    wake_cv_.notify_all();

    if (poll_thread_.joinable()) {
        poll_thread_.join();
        LOG_INFO("[Coordinator] Poll thread stopped");
    }

    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (listener_) {
        listener_->stop();
    }
}

void Coordinator::request_refresh() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        refresh_requested_ = true;
    }
    wake_cv_.notify_all();
}

void Coordinator::poll_loop() {
    while (polling_active_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, std::chrono::milliseconds(polling_.interval_ms),
                              [this] { return refresh_requested_ || !polling_active_.load(); });
            refresh_requested_ = false;
        }
        if (!polling_active_.load()) {
            break;
        }

        SyncResult result = refresh();
        if (!result.success) {
            LOG_WARN("[Coordinator] Update failed: " << result.error_message << " (retrying next interval)");
        }
    }
}

SyncResult Coordinator::refresh() {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    ensure_listener_running();

    SyncResult result;
    std::vector<bridge::v1::Device> devices;
    const int max_attempts = polling_.max_attempts < 1 ? 1 : polling_.max_attempts;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        result.attempts = attempt;
        if (client_.discover_devices(devices, polling_.attempt_timeout_ms)) {
            result.success = true;
            break;
        }

        result.status_code = client_.last_status_code();
        result.error_message = client_.last_error();

        if (result.status_code != bridge::v1::Status_Code_CODE_DEADLINE_EXCEEDED) {
            break;
        }
        if (attempt == max_attempts) {
            result.error_message = "Timed out after " + std::to_string(max_attempts) + " attempts";
            break;
        }

        LOG_WARN("[Coordinator] Device list timed out (attempt " << attempt << "/" << max_attempts
                                                                 << "), retrying");
        if (!sleep_for_retry(polling_.retry_delay_ms)) {
            result.status_code = bridge::v1::Status_Code_CODE_UNAVAILABLE;
            result.error_message = "Refresh cancelled by shutdown";
            break;
        }
    }

    if (result.success) {
        result.status_code = bridge::v1::Status_Code_CODE_OK;
        result.error_message.clear();
        result.device_count = store_.merge_full(devices);
        set_available(true);
        LOG_DEBUG("[Coordinator] Refreshed " << result.device_count << " devices");

        if (event_emitter_) {
            event_emitter_->emit(events::SnapshotEvent::create(result.device_count, "poll"));
        }
    } else {
        set_available(false);
        LOG_ERROR("[Coordinator] Error communicating with hub: " << result.error_message);
    }

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        last_sync_ = result;
    }
    return result;
}

SyncResult Coordinator::last_sync_result() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return last_sync_;
}

bool Coordinator::sleep_for_retry(int delay_ms) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    return !wake_cv_.wait_for(lock, std::chrono::milliseconds(delay_ms), [this] { return stopping_.load(); });
}

void Coordinator::set_available(bool available) {
    const bool previous = available_.exchange(available);
    if (previous == available) {
        return;
    }

    if (available) {
        LOG_INFO("[Coordinator] Hub available");
    } else {
        LOG_WARN("[Coordinator] Hub unavailable");
    }
    if (event_emitter_) {
        event_emitter_->emit(events::AvailabilityEvent::create(available));
    }
}

//=== Push Listener supervision

void Coordinator::ensure_listener_running() {
    if (!push_.enabled || stopping_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (!listener_) {
        ReconnectPolicy policy;
        policy.max_retries = push_.max_retries;
        policy.base_backoff_ms = push_.base_backoff_ms;
        policy.wait_ms = push_.wait_ms;

        listener_ = std::make_unique<PushListener>(client_, store_, policy);
        listener_->set_update_handler(
            [this](const bridge::v1::StateUpdate &update, bool applied) { on_push_update(update, applied); });
        listener_->set_give_up_handler([this]() { on_listener_give_up(); });
        listener_->start();
        return;
    }

    if (!listener_->is_running()) {
        LOG_INFO("[Coordinator] Push listener not running, restarting");
        listener_->restart();
    }
}

void Coordinator::on_listener_give_up() {
    store_.clear();
    LOG_WARN("[Coordinator] Push listener gave up; snapshot cleared until the next poll");
    set_available(true);

    if (event_emitter_) {
        event_emitter_->emit(events::SnapshotEvent::create(0, "cleared"));
    }
}

void Coordinator::on_push_update(const bridge::v1::StateUpdate &update, bool applied) {
    if (applied) {
        emit_channel_update(update, "push");
    }
}

PushListener::Snapshot Coordinator::listener_snapshot() const {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (!listener_) {
        PushListener::Snapshot idle;
        idle.max_retries = push_.max_retries;
        return idle;
    }
    return listener_->snapshot();
}

//=== Read API

std::vector<bridge::v1::Device> Coordinator::get_devices() const { return store_.read(); }

std::optional<bridge::v1::Device> Coordinator::get_device(const std::string &device_id) const {
    return store_.get_device(device_id);
}

std::optional<state::DeviceInfo> Coordinator::get_device_info(const std::string &device_id) const {
    return store_.get_device_info(device_id);
}

//=== Single-Flight Query Path

DeviceQueryResult Coordinator::get_device_data(const std::string &device_id, int timeout_ms) {
    std::lock_guard<std::mutex> single_flight(query_mutex_);

    DeviceQueryResult result;
    const int timeout = timeout_ms > 0 ? timeout_ms : query_.timeout_ms;
    const int max_attempts = query_.max_attempts < 1 ? 1 : query_.max_attempts;
    std::vector<bridge::v1::Device> devices;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (client_.discover_device(device_id, timeout, devices)) {
            result.success = true;
            break;
        }

        result.status_code = client_.last_status_code();
        result.error_message = client_.last_error();

        if (result.status_code != bridge::v1::Status_Code_CODE_DEADLINE_EXCEEDED) {
            break;
        }
        if (attempt == max_attempts) {
            result.error_message = "Timed out after " + std::to_string(max_attempts) + " attempts";
            break;
        }

        LOG_WARN("[Coordinator] Query for " << device_id << " timed out (attempt " << attempt << "/"
                                            << max_attempts << "), retrying");
        if (!sleep_for_retry(query_.retry_delay_ms)) {
            result.status_code = bridge::v1::Status_Code_CODE_UNAVAILABLE;
            result.error_message = "Query cancelled by shutdown";
            break;
        }
    }

    if (!result.success) {
        LOG_ERROR("[Coordinator] Error fetching data for device " << device_id << ": " << result.error_message);
        return result;
    }

    result.status_code = bridge::v1::Status_Code_CODE_OK;
    result.error_message.clear();
    for (auto &device : devices) {
        if (device.me().empty()) {
            LOG_DEBUG("[Coordinator] Dropping query entry without id");
            continue;
        }
        result.devices.push_back(std::move(device));
    }
    return result;
}

//=== Command Path

CommandResult Coordinator::set_device_state(const std::string &device_id, const hub::DeviceCommand &command,
                                            int timeout_ms) {
    CommandResult result;

    if (device_id.empty() || command.idx.empty()) {
        result.status_code = bridge::v1::Status_Code_CODE_INVALID_ARGUMENT;
        result.error_message = "Device id and channel are required";
        return result;
    }

    if (!available()) {
        LOG_INFO("[Coordinator] Hub unavailable, skipping command for " << device_id << " " << command.idx);
        result.success = true;
        result.changed = false;
        return result;
    }

    const int timeout = timeout_ms > 0 ? timeout_ms : kDefaultCommandTimeoutMs;
    hub::CommandReply reply;
    if (!client_.set_device_state(device_id, command, timeout, reply)) {
        result.status_code = client_.last_status_code();
        result.error_message = client_.last_error();
        if (result.status_code == bridge::v1::Status_Code_CODE_DEADLINE_EXCEEDED) {
            LOG_ERROR("[Coordinator] Timeout setting state for " << device_id << " " << command.idx);
        } else {
            LOG_ERROR("[Coordinator] Error setting state for " << device_id << ": " << result.error_message);
        }
        return result;
    }

    result.hub_code = reply.code;
    result.hub_msg = reply.msg;
    if (reply.code != 0) {
        result.status_code = bridge::v1::Status_Code_CODE_FAILED_PRECONDITION;
        result.error_message = "Hub rejected command (code " + std::to_string(reply.code) + ")" +
                               (reply.msg.empty() ? "" : ": " + reply.msg);
        LOG_ERROR("[Coordinator] " << result.error_message);
        return result;
    }

    result.success = true;
    result.changed = true;

    bridge::v1::StateUpdate applied;
    applied.set_me(device_id);
    applied.set_idx(command.idx);
    *applied.mutable_val() = command.val;
    if (store_.merge_delta(applied)) {
        emit_channel_update(applied, "command");
    }

    request_refresh();
    return result;
}

void Coordinator::emit_channel_update(const bridge::v1::StateUpdate &update, const std::string &source) {
    if (!event_emitter_) {
        return;
    }

    std::string value_json;
    if (!google::protobuf::util::MessageToJsonString(update.val(), &value_json).ok()) {
        value_json = "null";
    }
    event_emitter_->emit(events::ChannelUpdateEvent::create(update.me(), update.idx(), value_json, source));
}

}  // namespace sync
}  // namespace hubsync
