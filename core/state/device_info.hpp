#pragma once

#include <string>
#include <vector>

#include "bridge.pb.h"

namespace hubsync {
namespace state {

// Per-channel addressing derived from a polled device
struct ChannelInfo {
    std::string idx;           // channel key, e.g. "L1"
    std::string display_name;  // "<device name> <channel name>"
    std::string composite_id;  // stable address, see composite_id()
};

// Static metadata of a device, derived from the last full poll
struct DeviceInfo {
    std::string device_id;
    std::string name;
    std::string model;       // devtype
    std::string hub_id;      // agt
    std::string sw_version;  // epver
    std::string manufacturer;
    std::vector<ChannelInfo> channels;
};

extern const char *const kManufacturer;

// Stable per-channel address: "<devtype>_<agt>_<me>_<idx>", lowercased, with every
// character outside [a-z0-9_] replaced by '_'
std::string composite_id(const std::string &devtype, const std::string &agt, const std::string &me,
                         const std::string &idx);

// Channel display name with the hub's "{$EPN}" placeholder removed and whitespace trimmed.
// Falls back to the channel key when nothing is left.
std::string clean_channel_name(const std::string &raw_name, const std::string &idx);

DeviceInfo make_device_info(const bridge::v1::Device &device);

}  // namespace state
}  // namespace hubsync
