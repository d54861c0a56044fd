#pragma once
#include "event_bus.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace relaygate {

struct EchoConfig {
    bool enabled = false;
    std::string progress_text = "thinking...";  // empty = no progress message
    std::string reply_prefix;
    bool async = true;                          // reply from a worker thread
    std::chrono::milliseconds delay{0};         // pause before each reply

    static EchoConfig from_json(const nlohmann::json& j);
};

// Loopback agent backend: answers each inbound message with an optional
// progress message and a final reply carrying the same content, tagged so
// the relay routes both back to the originating request.
class EchoBackend {
public:
    EchoBackend(EventBus& bus, EchoConfig config);
    ~EchoBackend();

    EchoBackend(const EchoBackend&) = delete;
    EchoBackend& operator=(const EchoBackend&) = delete;

    // Subscribe to InboundMessageEvent. Idempotent.
    void subscribe_events();

    // Unsubscribe, wake delayed replies and join all reply workers.
    void shutdown();

    size_t replies_sent() const { return replies_sent_.load(); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reply(const InboundMessage& msg);
    bool wait_delay();
    void reap_finished();  // requires mutex_

    EventBus& bus_;
    EchoConfig config_;
    ScopedSubscription inbound_sub_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool shutting_down_ = false;
    std::vector<Worker> workers_;
    std::atomic<size_t> replies_sent_{0};
};

} // namespace relaygate
