#include "config.hpp"
#include "event_bus.hpp"
#include "echo_backend.hpp"
#include "channels/http_relay.hpp"
#include "http.hpp"
#include "sse.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <memory>
#include <nlohmann/json.hpp>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: relaygate [options]\n"
              << "\n"
              << "Gateway options:\n"
              << "  --config PATH        Config file (default: ~/.relaygate/config.json)\n"
              << "  --host HOST          Override HTTP relay bind address\n"
              << "  --port N             Override HTTP relay port\n"
              << "  --echo               Answer every message with the built-in echo backend\n"
              << "\n"
              << "Client options:\n"
              << "  -s, --send MESSAGE   POST MESSAGE to a running relay and print the stream\n"
              << "  --url URL            Relay endpoint (default: from config)\n"
              << "  --sender ID          Sender id for --send (default: cli)\n"
              << "  --chat ID            Chat id for --send (default: cli)\n"
              << "\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  RELAYGATE_HTTP_HOST        Bind address\n"
              << "  RELAYGATE_HTTP_PORT        Port\n"
              << "  RELAYGATE_TIMEOUT_SECONDS  Silence allowed between streamed messages\n"
              << "  RELAYGATE_DEBUG            Print debug-level log lines\n";
}

// Client mode: POST one message and print each event as it arrives.
static int run_send(const std::string& url, const std::string& sender,
                    const std::string& chat, const std::string& message) {
    nlohmann::json body = {{"sender_id", sender}, {"chat_id", chat}, {"content", message}};

    bool got_response = false;
    auto resp = relaygate::http_stream_events(
        url, body.dump(), {{"Content-Type", "application/json"}, {"Accept", "text/event-stream"}},
        [&got_response](const relaygate::SseEvent& ev) {
            std::cout << "[" << (ev.event.empty() ? "message" : ev.event) << "] "
                      << relaygate::sse_event_content(ev) << std::endl;
            if (ev.event == "response") got_response = true;
            return !got_response;
        });

    if (!resp.error.empty()) {
        std::cerr << "Error: " << resp.error << "\n";
        return 1;
    }
    if (resp.status_code != 200) {
        std::cerr << "Error: HTTP " << resp.status_code << " " << resp.body << "\n";
        return 1;
    }
    return got_response ? 0 : 1;
}

static int run_gateway(relaygate::Config& config, bool force_echo) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    relaygate::EventBus bus;

    std::unique_ptr<relaygate::EchoBackend> echo;
    if (force_echo || config.echo.enabled) {
        echo = std::make_unique<relaygate::EchoBackend>(bus, config.echo);
        echo->subscribe_events();
        std::cerr << "[echo] Echo backend enabled\n";
    }

    if (!config.http_relay.enabled) {
        std::cerr << "Error: http_relay channel is disabled in config.\n";
        return 1;
    }

    relaygate::HttpRelayChannel relay(config.http_relay, bus);
    relay.subscribe_events();

    try {
        relay.start();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    relay.run(&g_shutdown);

    std::cerr << "[http_relay] Shutting down.\n";
    relay.stop();
    if (echo) echo->shutdown();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string host;
    std::string port;
    std::string message;
    std::string url;
    std::string sender = "cli";
    std::string chat = "cli";
    bool echo = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            host = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port = argv[++i];
        } else if (std::strcmp(argv[i], "--echo") == 0) {
            echo = true;
        } else if ((std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "--send") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            url = argv[++i];
        } else if (std::strcmp(argv[i], "--sender") == 0 && i + 1 < argc) {
            sender = argv[++i];
        } else if (std::strcmp(argv[i], "--chat") == 0 && i + 1 < argc) {
            chat = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = relaygate::Config::load(config_path);
    relaygate::set_debug_logging(config.debug);

    // Override config with CLI args
    if (!host.empty()) config.http_relay.host = host;
    if (!port.empty()) {
        int p = std::stoi(port);
        if (p < 0 || p > 65535) {
            std::cerr << "Error: invalid port " << port << "\n";
            return 1;
        }
        config.http_relay.port = static_cast<uint16_t>(p);
    }

    // Client mode
    if (!message.empty()) {
        if (url.empty()) {
            url = "http://" + config.http_relay.listen_addr() + config.http_relay.path;
        }
        std::signal(SIGINT, signal_handler);
        relaygate::http_init();
        relaygate::http_set_abort_flag(&g_shutdown);
        int rc = run_send(url, sender, chat, message);
        relaygate::http_cleanup();
        return rc;
    }

    return run_gateway(config, echo);
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
