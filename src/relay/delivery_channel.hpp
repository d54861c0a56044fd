#pragma once
#include "channel.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace relaygate {

enum class PopStatus {
    Message,  // out was filled
    Timeout,  // nothing arrived within the window
    Closed,   // channel was closed; no further messages will arrive
};

// Unbounded per-request FIFO carrying outbound messages from the dispatcher
// to one streaming loop. push() never blocks beyond the internal mutex.
class DeliveryChannel {
public:
    // Enqueue a message. Returns false (and drops it) if the channel is closed.
    bool push(OutboundMessage msg);

    // Wait up to timeout for the next message.
    PopStatus pop(OutboundMessage& out, std::chrono::milliseconds timeout);

    // Discard queued messages and wake any waiter with PopStatus::Closed.
    // Returns the number of messages discarded.
    size_t close();

    bool closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OutboundMessage> queue_;
    bool closed_ = false;
};

} // namespace relaygate
