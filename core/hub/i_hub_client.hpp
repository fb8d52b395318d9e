#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bridge.pb.h"

namespace hubsync {
namespace hub {

// Arguments of one channel write ("ep" command on the hub)
struct DeviceCommand {
    std::string idx;   // channel key, e.g. "L1"
    std::string type;  // hub value-type tag, e.g. "0x81"; empty lets the bridge choose
    google::protobuf::Value val;
};

// Hub reply to a write. code == 0 means the hub accepted the command.
struct CommandReply {
    int code = -1;
    std::string msg;
};

// Capability set of the device hub as seen by the coordinator. Implementations own
// their connections; callers never touch transport state beyond reset_connection().
//
// All operations return false on failure and leave the reason in last_error() and
// last_status_code(). CODE_DEADLINE_EXCEEDED marks a timeout.
class IHubClient {
public:
    virtual ~IHubClient() = default;

    // Full enumeration ("msg" list)
    virtual bool discover_devices(std::vector<bridge::v1::Device> &devices, int timeout_ms) = 0;

    // Detail of one device; the hub answers in the same list shape
    virtual bool discover_device(const std::string &device_id, int timeout_ms,
                                 std::vector<bridge::v1::Device> &devices) = 0;

    // Waits up to wait_ms for the next push event. Returns true with an empty optional
    // when nothing arrived in time, false when the stream failed or closed.
    virtual bool next_state_update(int wait_ms, std::optional<bridge::v1::StateUpdate> &update) = 0;

    virtual bool set_device_state(const std::string &device_id, const DeviceCommand &command, int timeout_ms,
                                  CommandReply &reply) = 0;

    // Closes the push stream so the next next_state_update() opens a fresh one. Best effort.
    virtual void reset_connection() = 0;

    virtual std::string last_error() const = 0;
    virtual bridge::v1::Status_Code last_status_code() const = 0;

    // Drops state kept for the calling thread. Called by threads that are about to exit.
    virtual void release_thread_state() {}
};

}  // namespace hub
}  // namespace hubsync
