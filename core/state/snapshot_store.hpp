#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "bridge.pb.h"
#include "device_info.hpp"

namespace hubsync {
namespace state {

// Snapshot Store - cached device list in hub order plus an id index.
//
// Every id in the index resolves to exactly one entry of the sequence and every entry
// is indexed once. All operations hold one mutex, so readers never see a half-replaced
// snapshot or a torn device record.
class SnapshotStore {
public:
    SnapshotStore() = default;

    SnapshotStore(const SnapshotStore &) = delete;
    SnapshotStore &operator=(const SnapshotStore &) = delete;

    // Replace the whole snapshot with a freshly polled device list.
    // Devices without an id are dropped, and so are repeated ids (first one wins).
    // Returns the number of devices stored.
    size_t merge_full(const std::vector<bridge::v1::Device> &devices);

    // Overwrite one channel value. Creates the channel record if missing.
    // Returns false (store unchanged) when the device is unknown or the event lacks
    // a channel index or a value.
    bool merge_delta(const bridge::v1::StateUpdate &update);

    // Read API - copies
    std::vector<bridge::v1::Device> read() const;
    std::optional<bridge::v1::Device> get_device(const std::string &device_id) const;
    std::optional<DeviceInfo> get_device_info(const std::string &device_id) const;

    void clear();

    size_t device_count() const;
    bool empty() const { return device_count() == 0; }

    // Incremented on every mutation
    uint64_t generation() const;

private:
    mutable std::mutex mutex_;
    std::vector<bridge::v1::Device> devices_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, DeviceInfo> info_;
    uint64_t generation_ = 0;
};

}  // namespace state
}  // namespace hubsync
