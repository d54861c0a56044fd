#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace relaygate {

std::string Config::default_path() {
    return expand_home("~/.relaygate/config.json");
}

nlohmann::json Config::defaults_json() {
    return {
        {"debug", false},
        {"channels", {
            {"http_relay", {
                {"enabled", true},
                {"host", "127.0.0.1"},
                {"port", 18790},
                {"path", "/message"},
                {"timeout_seconds", 900},
                {"max_body", 1048576}
            }}
        }},
        {"echo", {
            {"enabled", false},
            {"progress_text", "thinking..."},
            {"reply_prefix", ""}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("debug") && j["debug"].is_boolean())
        cfg.debug = j["debug"].get<bool>();

    // Channel configurations: raw JSON per channel name
    if (j.contains("channels") && j["channels"].is_object()) {
        for (auto& [name, obj] : j["channels"].items()) {
            if (obj.is_object())
                cfg.channels[name] = obj;
        }
    }
    cfg.http_relay = HttpRelayConfig::from_json(cfg.channel_config("http_relay"));

    if (j.contains("echo"))
        cfg.echo = EchoConfig::from_json(j["echo"]);

    return cfg;
}

static void apply_env_overrides(Config& cfg) {
    if (const char* v = std::getenv("RELAYGATE_HTTP_HOST"))
        cfg.http_relay.host = v;
    if (const char* v = std::getenv("RELAYGATE_HTTP_PORT")) {
        try {
            int port = std::stoi(v);
            if (port >= 0 && port <= 65535)
                cfg.http_relay.port = static_cast<uint16_t>(port);
            else
                std::cerr << "[config] Ignoring out-of-range RELAYGATE_HTTP_PORT: " << v << "\n";
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid RELAYGATE_HTTP_PORT: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("RELAYGATE_TIMEOUT_SECONDS")) {
        try {
            double secs = std::stod(v);
            if (secs > 0)
                cfg.http_relay.timeout_seconds = std::min(secs, HttpRelayConfig::kMaxTimeoutSeconds);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid RELAYGATE_TIMEOUT_SECONDS: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("RELAYGATE_DEBUG")) {
        std::string s = to_lower(trim(v));
        cfg.debug = !s.empty() && s != "0" && s != "false";
    }
}

Config Config::load(const std::string& path) {
    std::string config_path = path.empty() ? default_path() : expand_home(path);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                else
                    std::cerr << "[config] Could not write migrated config: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << " (" << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);
    apply_env_overrides(cfg);
    return cfg;
}

nlohmann::json Config::channel_config(const std::string& name) const {
    auto it = channels.find(name);
    if (it != channels.end()) return it->second;
    return nlohmann::json::object();
}

} // namespace relaygate
