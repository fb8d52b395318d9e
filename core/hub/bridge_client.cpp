#include "bridge_client.hpp"

#include "logging/logger.hpp"

namespace hubsync {
namespace hub {

BridgeClient::BridgeClient(const BridgeConfig &config)
    : config_(config),
      command_session_(std::make_unique<BridgeSession>("hub-command", config)),
      event_session_(std::make_unique<BridgeSession>("hub-events", config)) {}

BridgeClient::~BridgeClient() { shutdown(); }

bool BridgeClient::start() {
    std::lock_guard<std::mutex> lock(command_mutex_);
    return ensure_command_session();
}

void BridgeClient::shutdown() {
    {
        std::lock_guard<std::mutex> lock(event_mutex_);
        event_session_->close();
    }
    {
        std::lock_guard<std::mutex> lock(command_mutex_);
        command_session_->close();
    }
}

//=== Command session

bool BridgeClient::ensure_command_session() {
    if (command_session_->is_healthy()) {
        return true;
    }
    LOG_INFO("[BridgeClient] Opening command session: " << config_.command);
    if (!command_session_->open()) {
        return fail_from(*command_session_);
    }
    return true;
}

bool BridgeClient::command_call(bridge::v1::Request &request, bridge::v1::Response &response, int timeout_ms) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (!ensure_command_session()) {
        return false;
    }
    if (!command_session_->call(request, response, timeout_ms)) {
        if (!command_session_->is_healthy()) {
            LOG_WARN("[BridgeClient] Command session failed: " << command_session_->last_error());
        }
        return fail_from(*command_session_);
    }
    clear_error();
    return true;
}

bool BridgeClient::discover_devices(std::vector<bridge::v1::Device> &devices, int timeout_ms) {
    bridge::v1::Request request;
    request.mutable_discover_devices()->set_timeout_ms(timeout_ms);

    bridge::v1::Response response;
    if (!command_call(request, response, timeout_ms)) {
        return false;
    }
    if (!response.has_discover_devices()) {
        return fail(bridge::v1::Status_Code_CODE_INTERNAL, "Response missing discover_devices field");
    }

    devices.assign(response.discover_devices().devices().begin(), response.discover_devices().devices().end());
    return true;
}

bool BridgeClient::discover_device(const std::string &device_id, int timeout_ms,
                                   std::vector<bridge::v1::Device> &devices) {
    bridge::v1::Request request;
    auto *discover = request.mutable_discover_device();
    discover->set_me(device_id);
    discover->set_timeout_ms(timeout_ms);

    bridge::v1::Response response;
    if (!command_call(request, response, timeout_ms)) {
        return false;
    }

    // A bridge that answers without a payload reports an empty result, not an error
    devices.clear();
    if (response.has_discover_device()) {
        devices.assign(response.discover_device().devices().begin(), response.discover_device().devices().end());
    }
    return true;
}

bool BridgeClient::set_device_state(const std::string &device_id, const DeviceCommand &command, int timeout_ms,
                                    CommandReply &reply) {
    bridge::v1::Request request;
    auto *set = request.mutable_set_device_state();
    set->set_me(device_id);
    set->set_idx(command.idx);
    set->set_type(command.type);
    *set->mutable_val() = command.val;
    set->set_timeout_ms(timeout_ms);

    bridge::v1::Response response;
    if (!command_call(request, response, timeout_ms)) {
        return false;
    }
    if (!response.has_set_device_state()) {
        return fail(bridge::v1::Status_Code_CODE_INTERNAL, "Response missing set_device_state field");
    }

    reply.code = response.set_device_state().code();
    reply.msg = response.set_device_state().msg();
    return true;
}

std::string BridgeClient::hub_id() const {
    std::lock_guard<std::mutex> lock(command_mutex_);
    return command_session_->hello_info().hub_id();
}

//=== Event session

bool BridgeClient::ensure_event_session() {
    if (event_session_->is_healthy()) {
        return true;
    }

    LOG_INFO("[BridgeClient] Opening event session");
    if (!event_session_->open()) {
        return fail_from(*event_session_);
    }

    bridge::v1::Request request;
    request.mutable_subscribe();
    bridge::v1::Response response;
    if (!event_session_->call(request, response, config_.timeout_ms)) {
        bool result = fail_from(*event_session_);
        event_session_->close();
        return result;
    }
    return true;
}

bool BridgeClient::next_state_update(int wait_ms, std::optional<bridge::v1::StateUpdate> &update) {
    update.reset();

    std::lock_guard<std::mutex> lock(event_mutex_);
    if (!ensure_event_session()) {
        return false;
    }

    bridge::v1::Response response;
    bool received = false;
    if (!event_session_->next_frame(response, wait_ms, received)) {
        return fail_from(*event_session_);
    }

    if (received) {
        if (!response.has_state_update()) {
            return fail(bridge::v1::Status_Code_CODE_INTERNAL, "Unexpected frame on event stream");
        }
        update = response.state_update();
    }

    clear_error();
    return true;
}

void BridgeClient::reset_connection() {
    std::lock_guard<std::mutex> lock(event_mutex_);
    LOG_DEBUG("[BridgeClient] Resetting event session");
    event_session_->close();
}

//=== Error state

std::string BridgeClient::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    auto it = errors_.find(std::this_thread::get_id());
    return it == errors_.end() ? std::string() : it->second.message;
}

bridge::v1::Status_Code BridgeClient::last_status_code() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    auto it = errors_.find(std::this_thread::get_id());
    return it == errors_.end() ? bridge::v1::Status_Code_CODE_OK : it->second.code;
}

bool BridgeClient::fail(bridge::v1::Status_Code code, const std::string &message) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    ErrorState &state = errors_[std::this_thread::get_id()];
    state.code = code;
    state.message = message;
    return false;
}

bool BridgeClient::fail_from(const BridgeSession &session) {
    return fail(session.last_status_code(), session.last_error());
}

void BridgeClient::clear_error() {
    std::lock_guard<std::mutex> lock(error_mutex_);
    errors_.erase(std::this_thread::get_id());
}

}  // namespace hub
}  // namespace hubsync
