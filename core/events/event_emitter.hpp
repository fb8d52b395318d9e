#pragma once

/**
 * @file event_emitter.hpp
 * @brief Fan-out of sync events to SSE clients
 *
 * The coordinator emits from the poll thread, the push listener thread and HTTP
 * workers (commands). Every subscriber owns a bounded queue; emit() never blocks on
 * a slow consumer, a full queue loses its oldest event instead.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "event_types.hpp"

namespace hubsync {
namespace events {

class EventEmitter;

// Bounded event queue of one subscriber
class SubscriberQueue {
public:
    explicit SubscriberQueue(size_t max_size, const std::string &name = "");

    // Never blocks. Returns false when the oldest event had to be dropped.
    bool push(const Event &event);

    // Blocks up to timeout_ms (0 = non-blocking)
    std::optional<Event> pop(int timeout_ms = 0);
    std::optional<Event> try_pop() { return pop(0); }

    size_t size() const;
    size_t dropped_count() const;

    // Wakes blocked consumers; later pushes are ignored
    void close();
    bool is_closed() const;

private:
    const size_t max_size_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    size_t dropped_ = 0;
    bool closed_ = false;
};

// Empty fields match everything. Both fields narrow channel updates only; snapshot
// and availability events concern the whole hub and always pass.
struct EventFilter {
    std::string device_id;
    std::string channel;

    bool matches(const Event &event) const;

    static EventFilter all() { return EventFilter{}; }
};

// Subscriber handle. Unsubscribes on destruction; must not outlive its emitter.
class Subscription {
public:
    using SubscriptionId = uint64_t;

    Subscription(EventEmitter &owner, SubscriptionId id, std::shared_ptr<SubscriberQueue> queue);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    std::optional<Event> pop(int timeout_ms = 100) { return queue_->pop(timeout_ms); }
    std::optional<Event> try_pop() { return queue_->try_pop(); }

    SubscriptionId id() const { return id_; }
    bool is_active() const { return !queue_->is_closed(); }
    size_t queue_size() const { return queue_->size(); }
    size_t dropped_count() const { return queue_->dropped_count(); }

    // Idempotent
    void unsubscribe();

private:
    EventEmitter &owner_;
    SubscriptionId id_;
    std::shared_ptr<SubscriberQueue> queue_;
};

class EventEmitter {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    /**
     * @param default_queue_size Queue bound used when subscribe() passes 0
     * @param max_subscribers Concurrent subscriber limit (0 = unlimited)
     */
    explicit EventEmitter(size_t default_queue_size = 100, size_t max_subscribers = 32);

    // Returns nullptr when the subscriber limit is reached
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "");

    // Stamps the next event id and queues the event for every matching subscriber
    void emit(Event event);

    uint64_t next_event_id() const { return next_event_id_.load(); }
    size_t subscriber_count() const;
    size_t max_subscribers() const { return max_subscribers_; }
    bool at_capacity() const;

private:
    friend class Subscription;

    struct Subscriber {
        SubscriptionId id;
        EventFilter filter;
        std::shared_ptr<SubscriberQueue> queue;
    };

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    mutable std::mutex mutex_;
    std::vector<Subscriber> subscribers_;
    SubscriptionId next_subscription_id_ = 1;
    std::atomic<uint64_t> next_event_id_{1};

    void remove(SubscriptionId id);
};

}  // namespace events
}  // namespace hubsync
