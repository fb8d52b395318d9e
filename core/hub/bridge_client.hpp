#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "bridge_config.hpp"
#include "bridge_session.hpp"
#include "i_hub_client.hpp"

namespace hubsync {
namespace hub {

// BridgeClient - IHubClient over two hub bridge processes.
//
// The command session carries request/response traffic (discovery and writes); the
// event session carries the subscription stream. Each session has its own lock, so a
// poll never waits behind the push stream and reset_connection() only tears down the
// event session. A failed session is respawned lazily on the next call that needs it.
//
// last_error()/last_status_code() report the most recent failure of the calling thread.
class BridgeClient : public IHubClient {
public:
    explicit BridgeClient(const BridgeConfig &config);
    ~BridgeClient() override;

    BridgeClient(const BridgeClient &) = delete;
    BridgeClient &operator=(const BridgeClient &) = delete;

    // Opens the command session eagerly so configuration errors surface at startup
    bool start();

    // Terminates both sessions
    void shutdown();

    bool discover_devices(std::vector<bridge::v1::Device> &devices, int timeout_ms) override;
    bool discover_device(const std::string &device_id, int timeout_ms,
                         std::vector<bridge::v1::Device> &devices) override;
    bool next_state_update(int wait_ms, std::optional<bridge::v1::StateUpdate> &update) override;
    bool set_device_state(const std::string &device_id, const DeviceCommand &command, int timeout_ms,
                          CommandReply &reply) override;
    void reset_connection() override;

    std::string last_error() const override;
    bridge::v1::Status_Code last_status_code() const override;
    void release_thread_state() override { clear_error(); }

    // Hub identity reported by the command session's Hello (empty before start())
    std::string hub_id() const;

private:
    struct ErrorState {
        std::string message;
        bridge::v1::Status_Code code = bridge::v1::Status_Code_CODE_OK;
    };

    BridgeConfig config_;

    mutable std::mutex command_mutex_;
    std::unique_ptr<BridgeSession> command_session_;

    std::mutex event_mutex_;
    std::unique_ptr<BridgeSession> event_session_;

    mutable std::mutex error_mutex_;
    std::unordered_map<std::thread::id, ErrorState> errors_;

    // Caller holds command_mutex_
    bool ensure_command_session();
    // Caller holds event_mutex_
    bool ensure_event_session();

    bool command_call(bridge::v1::Request &request, bridge::v1::Response &response, int timeout_ms);

    bool fail(bridge::v1::Status_Code code, const std::string &message);
    bool fail_from(const BridgeSession &session);
    void clear_error();
};

}  // namespace hub
}  // namespace hubsync
