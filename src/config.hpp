#pragma once
#include "channels/http_relay.hpp"
#include "echo_backend.hpp"
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace relaygate {

struct Config {
    bool debug = false;    // enables debug-level log lines

    HttpRelayConfig http_relay;
    EchoConfig echo;

    // Raw JSON per channel name, including channels this build does not run
    std::unordered_map<std::string, nlohmann::json> channels;

    // Default config file location
    static std::string default_path();

    // Load from path (default_path() if empty) + env vars. A missing file is
    // created with defaults; an existing one gains any new default keys.
    // A malformed file falls back to defaults and is left untouched.
    static Config load(const std::string& path = "");

    // Build from an already-parsed document (no file access, no env vars)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Get JSON config for a channel name (empty object if absent)
    nlohmann::json channel_config(const std::string& name) const;
};

// Recursively add keys from defaults that are missing in existing.
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

} // namespace relaygate
