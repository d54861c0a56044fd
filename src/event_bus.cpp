#include "event_bus.hpp"
#include <algorithm>

namespace relaygate {

namespace {

// Removes the calling thread from a subscription's caller list when the
// handler returns or throws.
class CallScope {
public:
    CallScope(std::mutex& mutex, std::condition_variable& cv,
              std::vector<std::thread::id>& callers)
        : mutex_(mutex), cv_(cv), callers_(callers) {}

    ~CallScope() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = std::find(callers_.begin(), callers_.end(),
                                std::this_thread::get_id());
            if (it != callers_.end()) callers_.erase(it);
        }
        cv_.notify_all();
    }

    CallScope(const CallScope&) = delete;
    CallScope& operator=(const CallScope&) = delete;

private:
    std::mutex& mutex_;
    std::condition_variable& cv_;
    std::vector<std::thread::id>& callers_;
};

} // namespace

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    auto sub = std::make_shared<Subscription>();
    sub->id = id;
    sub->handler = std::move(handler);
    handlers_[tag].push_back(std::move(sub));
    return id;
}

void EventBus::retire(std::unique_lock<std::mutex>& lock, const SubscriptionPtr& sub) {
    sub->live = false;
    const auto self = std::this_thread::get_id();
    idle_cv_.wait(lock, [&] {
        return std::all_of(sub->callers.begin(), sub->callers.end(),
                           [&](const std::thread::id& t) { return t == self; });
    });
}

bool EventBus::unsubscribe(uint64_t id) {
    std::unique_lock<std::mutex> lock(mutex_);
    SubscriptionPtr found;
    for (auto& entry : handlers_) {
        auto& subs = entry.second;
        auto it = std::find_if(subs.begin(), subs.end(),
                               [id](const SubscriptionPtr& s) { return s->id == id; });
        if (it != subs.end()) {
            found = *it;
            subs.erase(it);
            break;
        }
    }
    if (!found) return false;
    retire(lock, found);
    return true;
}

void EventBus::publish(const Event& event) {
    // Snapshot under lock, call without it: a handler on another thread
    // (a relay request publishing, say) must never wait on this one.
    std::vector<SubscriptionPtr> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it == handlers_.end()) return;
        to_call = it->second;
    }
    for (const auto& sub : to_call) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!sub->live) continue;
            sub->callers.push_back(std::this_thread::get_id());
        }
        CallScope scope(mutex_, idle_cv_, sub->callers);
        sub->handler(event);
    }
}

void EventBus::clear() {
    std::unique_lock<std::mutex> lock(mutex_);
    std::vector<SubscriptionPtr> all;
    for (auto& entry : handlers_) {
        all.insert(all.end(), entry.second.begin(), entry.second.end());
    }
    handlers_.clear();
    for (const auto& sub : all) sub->live = false;
    for (const auto& sub : all) retire(lock, sub);
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace relaygate
