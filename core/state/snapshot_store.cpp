#include "snapshot_store.hpp"

#include "logging/logger.hpp"

namespace hubsync {
namespace state {

size_t SnapshotStore::merge_full(const std::vector<bridge::v1::Device> &devices) {
    std::vector<bridge::v1::Device> next;
    std::unordered_map<std::string, size_t> next_index;
    std::unordered_map<std::string, DeviceInfo> next_info;
    next.reserve(devices.size());

    for (const auto &device : devices) {
        if (device.me().empty()) {
            LOG_WARN("[SnapshotStore] Dropping device without id (devtype=" << device.devtype() << ")");
            continue;
        }
        if (next_index.count(device.me()) > 0) {
            LOG_WARN("[SnapshotStore] Dropping duplicate device id: " << device.me());
            continue;
        }
        next_index.emplace(device.me(), next.size());
        next_info.emplace(device.me(), make_device_info(device));
        next.push_back(device);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    devices_.swap(next);
    index_.swap(next_index);
    info_.swap(next_info);
    ++generation_;
    return devices_.size();
}

bool SnapshotStore::merge_delta(const bridge::v1::StateUpdate &update) {
    // Malformed events count as absent
    if (update.idx().empty() || !update.has_val()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(update.me());
    if (it == index_.end()) {
        return false;
    }

    auto &channels = *devices_[it->second].mutable_data();
    *channels[update.idx()].mutable_v() = update.val();
    ++generation_;
    return true;
}

std::vector<bridge::v1::Device> SnapshotStore::read() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

std::optional<bridge::v1::Device> SnapshotStore::get_device(const std::string &device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(device_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return devices_[it->second];
}

std::optional<DeviceInfo> SnapshotStore::get_device_info(const std::string &device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = info_.find(device_id);
    if (it == info_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SnapshotStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();
    index_.clear();
    info_.clear();
    ++generation_;
}

size_t SnapshotStore::device_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

uint64_t SnapshotStore::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

}  // namespace state
}  // namespace hubsync
