#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace relaygate {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl) {
    if (g_http_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

struct EventStreamContext {
    CURL* curl = nullptr;
    SseCallback* callback = nullptr;
    SseParser parser;
    std::string* error_body = nullptr;
    bool aborted = false;
};

static size_t event_stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<EventStreamContext*>(userdata);
    if (ctx->aborted) return 0;

    // Headers are complete before the first body byte arrives.
    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        ctx->error_body->append(ptr, total);
        return total;
    }

    if (!ctx->parser.feed(std::string(ptr, total), *ctx->callback)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static void setup_post(CurlRequest& req, const std::string& url, const std::string& body,
                       const std::vector<Header>& headers, long timeout) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    apply_abort_hook(req.curl);
}

static void finish(CURL* curl, CURLcode res, HttpResponse& response) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    if (res != CURLE_OK) response.error = curl_easy_strerror(res);
}

// ── Public API ────────────────────────────────────────────────

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }
    setup_post(req, url, body, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    finish(req.curl, curl_easy_perform(req.curl), response);
    return response;
}

HttpResponse http_stream_events(const std::string& url,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                SseCallback callback,
                                long timeout_seconds) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }
    setup_post(req, url, body, headers, timeout_seconds);

    EventStreamContext ctx;
    ctx.curl = req.curl;
    ctx.callback = &callback;
    ctx.error_body = &response.body;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, event_stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(req.curl);
    // An abort requested by the callback is not a transport error.
    if (ctx.aborted && res == CURLE_WRITE_ERROR) res = CURLE_OK;
    finish(req.curl, res, response);
    return response;
}

} // namespace relaygate
