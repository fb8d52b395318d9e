#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "bridge.pb.h"
#include "bridge_config.hpp"
#include "bridge_process.hpp"

namespace hubsync {
namespace hub {

// BridgeSession speaks HBP over one bridge process: spawn + Hello handshake,
// request/response correlation by request_id, and reading of streamed frames.
// Not thread-safe; BridgeClient serializes access per session.
class BridgeSession {
public:
    BridgeSession(const std::string &session_name, const BridgeConfig &config);
    ~BridgeSession();

    BridgeSession(const BridgeSession &) = delete;
    BridgeSession &operator=(const BridgeSession &) = delete;

    // Spawn the bridge and complete the Hello handshake
    bool open();

    // Terminate the bridge process. Safe on a closed session.
    void close();

    bool is_healthy() const { return healthy_.load(std::memory_order_acquire) && process_.is_running(); }

    // Send request and wait for the response carrying the same request_id
    bool call(bridge::v1::Request &request, bridge::v1::Response &response, int timeout_ms);

    // Wait up to wait_ms for one unsolicited frame (streaming mode).
    // Returns true with received == false when nothing arrived.
    bool next_frame(bridge::v1::Response &response, int wait_ms, bool &received);

    const std::string &session_name() const { return process_.session_name(); }
    const std::string &last_error() const { return error_; }
    bridge::v1::Status_Code last_status_code() const { return last_status_code_; }
    const bridge::v1::HelloResponse &hello_info() const { return hello_; }

private:
    BridgeConfig config_;
    BridgeProcess process_;
    std::atomic<bool> healthy_{false};
    uint64_t next_request_id_ = 1;
    std::string error_;
    bridge::v1::Status_Code last_status_code_ = bridge::v1::Status_Code_CODE_OK;
    bridge::v1::HelloResponse hello_;

    bool read_response(bridge::v1::Response &response, int timeout_ms);
    bool fail(bridge::v1::Status_Code code, const std::string &message);
};

}  // namespace hub
}  // namespace hubsync
