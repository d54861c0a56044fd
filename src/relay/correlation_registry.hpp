#pragma once
#include "relay/delivery_channel.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace relaygate {

// Raised when a correlation ID is registered twice. Indicates broken ID
// generation; fails the single request, never the process.
class DuplicateIdentifier : public std::runtime_error {
public:
    explicit DuplicateIdentifier(const std::string& id)
        : std::runtime_error("Duplicate correlation id: " + id) {}
};

// Raised when registering after close_all() (relay shutting down).
class RegistryClosed : public std::runtime_error {
public:
    RegistryClosed() : std::runtime_error("Correlation registry is closed") {}
};

// Maps correlation IDs to the delivery channel of the request waiting on
// them. One mutex guards the map; every operation is O(1) and never waits
// on a channel or on I/O.
class CorrelationRegistry {
public:
    // Create and insert a fresh channel for id.
    std::shared_ptr<DeliveryChannel> register_request(const std::string& id);

    // Channel for id, or nullptr.
    std::shared_ptr<DeliveryChannel> lookup(const std::string& id) const;

    // Drop the entry and close its channel. Idempotent.
    void remove(const std::string& id);

    bool contains(const std::string& id) const;
    size_t size() const;

    // Close (drain) every channel, clear the map and refuse further
    // registrations. Returns the number of entries released.
    size_t close_all();

    // Accept registrations again after close_all() (channel restart).
    void reopen();

    bool accepting() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<DeliveryChannel>> pending_;
    bool accepting_ = true;
};

// Removes its ID from the registry when it goes out of scope.
class RegistrationGuard {
public:
    RegistrationGuard(CorrelationRegistry& registry, std::string id)
        : registry_(registry), id_(std::move(id)) {}
    ~RegistrationGuard() { registry_.remove(id_); }

    RegistrationGuard(const RegistrationGuard&) = delete;
    RegistrationGuard& operator=(const RegistrationGuard&) = delete;

private:
    CorrelationRegistry& registry_;
    std::string id_;
};

} // namespace relaygate
