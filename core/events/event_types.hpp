#pragma once

/**
 * @file event_types.hpp
 * @brief Change notifications emitted by the sync coordinator
 *
 * Consumed by the SSE endpoint. Events are immutable value types; values are carried
 * as pre-rendered JSON so consumers need no protobuf dependency.
 * Timestamps are epoch milliseconds.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace hubsync {
namespace events {

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief One channel value changed
 *
 * Source is "push" for stream deltas and "command" for optimistic writes.
 */
struct ChannelUpdateEvent {
    uint64_t event_id;
    std::string device_id;
    std::string channel;
    std::string value_json;
    std::string source;
    int64_t timestamp_ms;

    static ChannelUpdateEvent create(const std::string &device_id, const std::string &channel,
                                     const std::string &value_json, const std::string &source) {
        return ChannelUpdateEvent{0, device_id, channel, value_json, source, now_epoch_ms()};
    }
};

/**
 * @brief The whole snapshot was replaced or cleared
 *
 * Reason is "poll" after a successful full refresh and "cleared" after the push
 * listener gave up.
 */
struct SnapshotEvent {
    uint64_t event_id;
    size_t device_count;
    std::string reason;
    int64_t timestamp_ms;

    static SnapshotEvent create(size_t device_count, const std::string &reason) {
        return SnapshotEvent{0, device_count, reason, now_epoch_ms()};
    }
};

// Hub availability flipped
struct AvailabilityEvent {
    uint64_t event_id;
    bool available;
    int64_t timestamp_ms;

    static AvailabilityEvent create(bool available) { return AvailabilityEvent{0, available, now_epoch_ms()}; }
};

using Event = std::variant<ChannelUpdateEvent, SnapshotEvent, AvailabilityEvent>;

inline uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

inline int64_t get_timestamp_ms(const Event &event) {
    return std::visit([](auto &&e) { return e.timestamp_ms; }, event);
}

}  // namespace events
}  // namespace hubsync
