#include "relay/correlation_registry.hpp"

namespace relaygate {

std::shared_ptr<DeliveryChannel> CorrelationRegistry::register_request(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) throw RegistryClosed();
    auto channel = std::make_shared<DeliveryChannel>();
    auto inserted = pending_.emplace(id, channel);
    if (!inserted.second) throw DuplicateIdentifier(id);
    return channel;
}

std::shared_ptr<DeliveryChannel> CorrelationRegistry::lookup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) return nullptr;
    return it->second;
}

void CorrelationRegistry::remove(const std::string& id) {
    std::shared_ptr<DeliveryChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return;
        channel = std::move(it->second);
        pending_.erase(it);
    }
    // A dispatcher still holding this channel from an earlier lookup now
    // gets push() == false instead of queueing into a dead request.
    channel->close();
}

bool CorrelationRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) != 0;
}

size_t CorrelationRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t CorrelationRegistry::close_all() {
    // Lock order is always registry -> channel; nothing takes them the other way.
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
    size_t released = pending_.size();
    for (auto& entry : pending_) {
        entry.second->close();
    }
    pending_.clear();
    return released;
}

void CorrelationRegistry::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = true;
}

bool CorrelationRegistry::accepting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepting_;
}

} // namespace relaygate
