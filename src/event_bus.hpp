#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <thread>
#include <cstdint>

namespace relaygate {

using EventHandler = std::function<void(const Event&)>;

// In-process publish/subscribe hub connecting channels to the agent backend.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed. Blocks until
    // calls to the handler running on other threads have returned, so the
    // handler's captures may be destroyed afterwards. A handler may
    // unsubscribe itself.
    bool unsubscribe(uint64_t id);

    // Publish an event synchronously on the caller's thread. Handlers are
    // called in registration order without the mutex held, so handlers may
    // publish or (un)subscribe. A handler removed before its turn is
    // skipped. The first handler exception aborts delivery and propagates
    // to the publisher.
    void publish(const Event& event);

    // Remove all subscriptions, waiting for in-flight calls as unsubscribe does.
    void clear();

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
        bool live = true;
        std::vector<std::thread::id> callers;  // one entry per running call
    };
    using SubscriptionPtr = std::shared_ptr<Subscription>;

    // Marks the subscription dead and waits for calls on other threads.
    void retire(std::unique_lock<std::mutex>& lock, const SubscriptionPtr& sub);

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, std::vector<SubscriptionPtr>> handlers_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Owns one subscription and drops it on destruction.
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { reset(); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : bus_(other.bus_), id_(other.id_) {
        other.bus_ = nullptr;
        other.id_ = 0;
    }
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            id_ = other.id_;
            other.bus_ = nullptr;
            other.id_ = 0;
        }
        return *this;
    }

    void reset() {
        if (bus_ && id_ != 0) bus_->unsubscribe(id_);
        bus_ = nullptr;
        id_ = 0;
    }

    bool active() const { return bus_ != nullptr && id_ != 0; }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

} // namespace relaygate
