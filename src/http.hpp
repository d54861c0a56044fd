#pragma once
#include "sse.hpp"
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace relaygate {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;  // 0 if the transfer failed before a status arrived
    std::string body;      // non-stream body (error responses for streams)
    std::string error;     // transport error text, empty on success
};

// HTTP POST, whole body buffered
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 120);

// HTTP POST whose 2xx response is a text/event-stream: each complete event
// goes to callback as it arrives (return false to abort). Bodies of
// non-2xx responses are collected into HttpResponse::body instead.
HttpResponse http_stream_events(const std::string& url,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                SseCallback callback,
                                long timeout_seconds = 0);

} // namespace relaygate
