#include "relay/delivery_channel.hpp"

namespace relaygate {

bool DeliveryChannel::push(OutboundMessage msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        queue_.push_back(std::move(msg));
    }
    cv_.notify_one();
    return true;
}

PopStatus DeliveryChannel::pop(OutboundMessage& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = cv_.wait_for(lock, timeout, [this] {
        return closed_ || !queue_.empty();
    });
    if (!ready) return PopStatus::Timeout;
    if (closed_) return PopStatus::Closed;
    out = std::move(queue_.front());
    queue_.pop_front();
    return PopStatus::Message;
}

size_t DeliveryChannel::close() {
    size_t discarded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        discarded = queue_.size();
        queue_.clear();
    }
    cv_.notify_all();
    return discarded;
}

bool DeliveryChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t DeliveryChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace relaygate
