#include "event_emitter.hpp"

#include <algorithm>
#include <chrono>

#include "logging/logger.hpp"

namespace hubsync {
namespace events {

namespace {
// A lagging SSE client would otherwise log once per event
constexpr size_t kDropLogEvery = 100;
}  // namespace

//=== SubscriberQueue

SubscriberQueue::SubscriberQueue(size_t max_size, const std::string &name) : max_size_(max_size), name_(name) {}

bool SubscriberQueue::push(const Event &event) {
    size_t dropped_total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return true;
        }
        if (max_size_ > 0 && events_.size() >= max_size_) {
            events_.pop_front();
            dropped_total = ++dropped_;
        }
        events_.push_back(event);
    }
    cv_.notify_one();

    if (dropped_total % kDropLogEvery == 1) {
        LOG_WARN("[Events] Subscriber '" << name_ << "' is lagging, " << dropped_total << " events dropped");
    }
    return dropped_total == 0;
}

std::optional<Event> SubscriberQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms > 0) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return closed_ || !events_.empty(); });
    }
    if (events_.empty()) {
        return std::nullopt;
    }

    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

size_t SubscriberQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

size_t SubscriberQueue::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void SubscriberQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool SubscriberQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

//=== EventFilter

bool EventFilter::matches(const Event &event) const {
    const auto *update = std::get_if<ChannelUpdateEvent>(&event);
    if (update == nullptr) {
        return true;
    }
    return (device_id.empty() || update->device_id == device_id) && (channel.empty() || update->channel == channel);
}

//=== Subscription

Subscription::Subscription(EventEmitter &owner, SubscriptionId id, std::shared_ptr<SubscriberQueue> queue)
    : owner_(owner), id_(id), queue_(std::move(queue)) {}

Subscription::~Subscription() { unsubscribe(); }

void Subscription::unsubscribe() {
    if (queue_->is_closed()) {
        return;
    }
    owner_.remove(id_);
    queue_->close();
}

//=== EventEmitter

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size), max_subscribers_(max_subscribers) {}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter &filter, size_t queue_size,
                                                      const std::string &name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_) {
        LOG_WARN("[Events] Subscriber limit (" << max_subscribers_ << ") reached, rejecting "
                                               << (name.empty() ? "subscriber" : name));
        return nullptr;
    }

    const SubscriptionId id = next_subscription_id_++;
    auto queue = std::make_shared<SubscriberQueue>(queue_size > 0 ? queue_size : default_queue_size_, name);
    subscribers_.push_back(Subscriber{id, filter, queue});

    LOG_DEBUG("[Events] Subscription " << id << (name.empty() ? "" : " (" + name + ")") << " added, "
                                       << subscribers_.size() << " active");
    return std::make_unique<Subscription>(*this, id, std::move(queue));
}

void EventEmitter::emit(Event event) {
    std::vector<std::shared_ptr<SubscriberQueue>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t id = next_event_id_++;
        std::visit([id](auto &e) { e.event_id = id; }, event);

        for (const auto &subscriber : subscribers_) {
            if (subscriber.filter.matches(event)) {
                targets.push_back(subscriber.queue);
            }
        }
    }

    // Queues have their own locks; pushing outside ours keeps subscribe() responsive
    for (const auto &queue : targets) {
        queue->push(event);
    }
}

size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

bool EventEmitter::at_capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_;
}

void EventEmitter::remove(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [id](const Subscriber &s) { return s.id == id; }),
                       subscribers_.end());
}

}  // namespace events
}  // namespace hubsync
