#include <catch2/catch_test_macros.hpp>
#include "relay/request_handler.hpp"
#include "relay/correlation_registry.hpp"
#include "relay/outbound_dispatcher.hpp"
#include "mock_response_writer.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace relaygate;
using namespace std::chrono_literals;
using json = nlohmann::json;

static ServerRequest post(const std::string& body) {
    ServerRequest req;
    req.method = "POST";
    req.path = "/message";
    req.body = body;
    return req;
}

static std::string error_of(const MockResponseWriter& writer) {
    return json::parse(writer.response().body).value("error", "");
}

static OutboundMessage reply(const std::string& id, const std::string& content, bool progress) {
    OutboundMessage m;
    m.channel = "http_relay";
    m.content = content;
    m.metadata = {{"progress", {{"request_id", id}, {"is_progress", progress}}}};
    return m;
}

// ── parse_relay_request ─────────────────────────────────────────

TEST_CASE("parse_relay_request: snake_case fields", "[request_handler]") {
    auto r = parse_relay_request(R"({"sender_id":"u1","chat_id":"c1","content":"hi"})");
    REQUIRE(r.sender_id == "u1");
    REQUIRE(r.chat_id == "c1");
    REQUIRE(r.content == "hi");
    REQUIRE(r.metadata.is_object());
    REQUIRE(r.metadata.empty());
}

TEST_CASE("parse_relay_request: camelCase aliases win over snake_case", "[request_handler]") {
    auto r = parse_relay_request(
        R"({"senderId":"camel","sender_id":"snake","chatId":"c","chat_id":"s","content":"x"})");
    REQUIRE(r.sender_id == "camel");
    REQUIRE(r.chat_id == "c");
}

TEST_CASE("parse_relay_request: empty alias falls through to the other spelling", "[request_handler]") {
    auto r = parse_relay_request(R"({"senderId":"","sender_id":"u","chat_id":"c","content":"x"})");
    REQUIRE(r.sender_id == "u");
}

TEST_CASE("parse_relay_request: numeric identifiers and content become text", "[request_handler]") {
    auto r = parse_relay_request(R"({"sender_id":42,"chat_id":7,"content":3})");
    REQUIRE(r.sender_id == "42");
    REQUIRE(r.chat_id == "7");
    REQUIRE(r.content == "3");
}

TEST_CASE("parse_relay_request: metadata object is kept, others ignored", "[request_handler]") {
    auto r = parse_relay_request(
        R"({"sender_id":"u","chat_id":"c","content":"x","metadata":{"trace":"t1"}})");
    REQUIRE(r.metadata["trace"] == "t1");

    r = parse_relay_request(R"({"sender_id":"u","chat_id":"c","content":"x","metadata":"nope"})");
    REQUIRE(r.metadata.is_object());
    REQUIRE(r.metadata.empty());
}

TEST_CASE("parse_relay_request: validation errors", "[request_handler]") {
    REQUIRE_THROWS_AS(parse_relay_request("{not json"), ValidationError);
    REQUIRE_THROWS_AS(parse_relay_request("[1,2]"), ValidationError);
    REQUIRE_THROWS_AS(parse_relay_request(R"({"chat_id":"c","content":"x"})"), ValidationError);
    REQUIRE_THROWS_AS(parse_relay_request(R"({"sender_id":"u","content":"x"})"), ValidationError);
    REQUIRE_THROWS_AS(parse_relay_request(R"({"sender_id":"u","chat_id":"c"})"), ValidationError);
    REQUIRE_THROWS_AS(parse_relay_request(R"({"sender_id":"","chat_id":"c","content":"x"})"),
                      ValidationError);
    REQUIRE_THROWS_AS(parse_relay_request(R"({"sender_id":"u","chat_id":"c","content":null})"),
                      ValidationError);
    REQUIRE_THROWS_AS(parse_relay_request(R"({"sender_id":{},"chat_id":"c","content":"x"})"),
                      ValidationError);
}

// ── merge_relay_metadata ────────────────────────────────────────

TEST_CASE("merge_relay_metadata: adds the id and keeps caller keys", "[request_handler]") {
    json meta = {{"trace", "t1"}, {"http_relay", {{"origin", "web"}}}};
    auto merged = merge_relay_metadata(meta, "rid");
    REQUIRE(merged["trace"] == "t1");
    REQUIRE(merged["http_relay"]["origin"] == "web");
    REQUIRE(merged["http_relay"]["request_id"] == "rid");
}

TEST_CASE("merge_relay_metadata: caller cannot override the id", "[request_handler]") {
    json meta = {{"http_relay", {{"request_id", "forged"}}}};
    REQUIRE(merge_relay_metadata(meta, "real")["http_relay"]["request_id"] == "real");

    meta = {{"http_relay", "scalar"}};
    REQUIRE(merge_relay_metadata(meta, "real")["http_relay"]["request_id"] == "real");
}

TEST_CASE("merge_relay_metadata: non-object metadata starts empty", "[request_handler]") {
    auto merged = merge_relay_metadata(json::array(), "rid");
    REQUIRE(merged.is_object());
    REQUIRE(merged.size() == 1);
}

// ── InboundRequestHandler: rejected requests ────────────────────

TEST_CASE("InboundRequestHandler: missing content is rejected without registering", "[request_handler]") {
    CorrelationRegistry reg;
    int published = 0;
    InboundRequestHandler handler(reg, [&](const RelayRequest&) { published++; }, 500ms);

    MockResponseWriter writer;
    auto result = handler.handle(post(R"({"sender_id":"u1","chat_id":"c1"})"), writer);

    REQUIRE(result.status == 400);
    REQUIRE(result.request_id.empty());
    REQUIRE_FALSE(result.outcome.has_value());
    REQUIRE(writer.response().status == 400);
    REQUIRE(error_of(writer) == "Missing sender_id/chat_id/content");
    REQUIRE_FALSE(writer.stream_opened());
    REQUIRE(published == 0);
    REQUIRE(reg.size() == 0);
}

TEST_CASE("InboundRequestHandler: malformed body messages", "[request_handler]") {
    CorrelationRegistry reg;
    InboundRequestHandler handler(reg, [](const RelayRequest&) {}, 500ms);

    MockResponseWriter bad_json;
    REQUIRE(handler.handle(post("{oops"), bad_json).status == 400);
    REQUIRE(error_of(bad_json) == "Invalid JSON body");

    MockResponseWriter not_object;
    REQUIRE(handler.handle(post("\"text\""), not_object).status == 400);
    REQUIRE(error_of(not_object) == "Payload must be an object");

    REQUIRE(reg.size() == 0);
}

TEST_CASE("InboundRequestHandler: closed registry answers 503", "[request_handler]") {
    CorrelationRegistry reg;
    reg.close_all();
    int published = 0;
    InboundRequestHandler handler(reg, [&](const RelayRequest&) { published++; }, 500ms);

    MockResponseWriter writer;
    auto result = handler.handle(post(R"({"sender_id":"u","chat_id":"c","content":"x"})"), writer);

    REQUIRE(result.status == 503);
    REQUIRE(writer.response().status == 503);
    REQUIRE_FALSE(writer.stream_opened());
    REQUIRE(published == 0);
}

TEST_CASE("InboundRequestHandler: id collision fails only that request", "[request_handler]") {
    CorrelationRegistry reg;
    auto existing = reg.register_request("fixed");
    InboundRequestHandler handler(reg, [](const RelayRequest&) {}, 500ms,
                                  [] { return std::string("fixed"); });

    MockResponseWriter writer;
    auto result = handler.handle(post(R"({"sender_id":"u","chat_id":"c","content":"x"})"), writer);

    REQUIRE(result.status == 500);
    REQUIRE(writer.response().status == 500);
    // The request that owns the id is unaffected
    REQUIRE(reg.lookup("fixed") == existing);
    REQUIRE_FALSE(existing->closed());
}

// ── InboundRequestHandler: streaming ────────────────────────────

TEST_CASE("InboundRequestHandler: progress then response", "[request_handler]") {
    CorrelationRegistry reg;
    OutboundDispatcher dispatcher(reg);
    RelayRequest seen;
    size_t registered_during_publish = 0;

    // The backend answers on another thread, like a real agent would
    std::vector<std::thread> backend;
    InboundRequestHandler handler(reg, [&](const RelayRequest& r) {
        seen = r;
        registered_during_publish = reg.size();
        std::string id = r.request_id;
        backend.emplace_back([&dispatcher, id] {
            dispatcher.deliver(reply(id, "thinking...", true));
            std::this_thread::sleep_for(20ms);
            dispatcher.deliver(reply(id, "hello back", false));
        });
    }, 2000ms);

    MockResponseWriter writer;
    auto result = handler.handle(
        post(R"({"sender_id":"u1","chat_id":"c1","content":"hi","metadata":{"trace":"t"}})"),
        writer);
    for (auto& t : backend) t.join();

    REQUIRE(result.status == 200);
    REQUIRE(result.outcome == StreamOutcome::Completed);
    REQUIRE(result.request_id.size() == 32);
    REQUIRE(registered_during_publish == 1);

    REQUIRE(seen.sender_id == "u1");
    REQUIRE(seen.content == "hi");
    REQUIRE(seen.metadata["trace"] == "t");
    REQUIRE(seen.metadata["http_relay"]["request_id"] == result.request_id);

    REQUIRE(writer.stream_status() == 200);
    REQUIRE(writer.stream_header("Content-Type") == "text/event-stream");
    REQUIRE(writer.stream_header("Cache-Control") == "no-cache");
    REQUIRE(writer.stream_header("X-Accel-Buffering") == "no");

    auto events = writer.events();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].event == "progress");
    REQUIRE(sse_event_content(events[0]) == "thinking...");
    REQUIRE(events[1].event == "response");
    REQUIRE(sse_event_content(events[1]) == "hello back");
    REQUIRE(writer.ended());
    REQUIRE(reg.size() == 0);
}

TEST_CASE("InboundRequestHandler: synchronous reply during publish is not lost", "[request_handler]") {
    CorrelationRegistry reg;
    OutboundDispatcher dispatcher(reg);
    InboundRequestHandler handler(reg, [&](const RelayRequest& r) {
        dispatcher.deliver(reply(r.request_id, "instant", false));
    }, 500ms);

    MockResponseWriter writer;
    auto result = handler.handle(post(R"({"sender_id":"u","chat_id":"c","content":"x"})"), writer);

    REQUIRE(result.outcome == StreamOutcome::Completed);
    auto events = writer.events();
    REQUIRE(events.size() == 1);
    REQUIRE(sse_event_content(events[0]) == "instant");
}

TEST_CASE("InboundRequestHandler: publish failure yields one failure notice", "[request_handler]") {
    CorrelationRegistry reg;
    InboundRequestHandler handler(reg, [](const RelayRequest&) {
        throw std::runtime_error("bus rejected");
    }, 500ms);

    MockResponseWriter writer;
    auto result = handler.handle(post(R"({"sender_id":"u","chat_id":"c","content":"x"})"), writer);

    REQUIRE(result.status == 200);
    REQUIRE(result.outcome == StreamOutcome::PublishFailed);
    auto events = writer.events();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "response");
    REQUIRE(sse_event_content(events[0]) == relay_notices::PublishFailed);
    REQUIRE(writer.ended());
    REQUIRE(reg.size() == 0);
}

TEST_CASE("InboundRequestHandler: silent backend times out", "[request_handler]") {
    CorrelationRegistry reg;
    InboundRequestHandler handler(reg, [](const RelayRequest&) {}, 50ms);

    MockResponseWriter writer;
    auto result = handler.handle(post(R"({"sender_id":"u","chat_id":"c","content":"x"})"), writer);

    REQUIRE(result.outcome == StreamOutcome::TimedOut);
    auto events = writer.events();
    REQUIRE(events.size() == 1);
    REQUIRE(sse_event_content(events[0]) == relay_notices::Timeout);
    REQUIRE(reg.size() == 0);
}

TEST_CASE("InboundRequestHandler: late reply after timeout is dropped", "[request_handler]") {
    CorrelationRegistry reg;
    OutboundDispatcher dispatcher(reg);
    std::string id;
    InboundRequestHandler handler(reg, [&](const RelayRequest& r) { id = r.request_id; }, 30ms);

    MockResponseWriter writer;
    handler.handle(post(R"({"sender_id":"u","chat_id":"c","content":"x"})"), writer);

    REQUIRE(dispatcher.deliver(reply(id, "too late", false)) == DeliveryResult::NoPendingRequest);
    REQUIRE(reg.size() == 0);
    REQUIRE(writer.events().size() == 1);
}

TEST_CASE("InboundRequestHandler: client disconnect releases the entry", "[request_handler]") {
    CorrelationRegistry reg;
    OutboundDispatcher dispatcher(reg);
    InboundRequestHandler handler(reg, [&](const RelayRequest& r) {
        dispatcher.deliver(reply(r.request_id, "p1", true));
        dispatcher.deliver(reply(r.request_id, "p2", true));
    }, 500ms);

    MockResponseWriter writer;
    writer.fail_after_chunks = 1;
    auto result = handler.handle(post(R"({"sender_id":"u","chat_id":"c","content":"x"})"), writer);

    REQUIRE(result.outcome == StreamOutcome::TransportError);
    REQUIRE_FALSE(writer.ended());
    REQUIRE(reg.size() == 0);
}

TEST_CASE("InboundRequestHandler: caller hanging up while waiting releases the entry", "[request_handler]") {
    CorrelationRegistry reg;
    InboundRequestHandler handler(reg, [](const RelayRequest&) {}, 60000ms);

    MockResponseWriter writer;
    HandleResult result;
    std::thread request([&] {
        result = handler.handle(post(R"({"sender_id":"u","chat_id":"c","content":"x"})"), writer);
    });

    REQUIRE(writer.wait_for_chunks(0));
    for (int i = 0; i < 200 && reg.size() == 0; ++i) std::this_thread::sleep_for(5ms);
    REQUIRE(reg.size() == 1);

    auto start = std::chrono::steady_clock::now();
    writer.peer_gone = true;
    request.join();

    REQUIRE(std::chrono::steady_clock::now() - start < 5000ms);
    REQUIRE(result.outcome == StreamOutcome::TransportError);
    REQUIRE(reg.size() == 0);
    REQUIRE(writer.events().empty());
}

TEST_CASE("InboundRequestHandler: failed stream start releases the entry", "[request_handler]") {
    CorrelationRegistry reg;
    int published = 0;
    InboundRequestHandler handler(reg, [&](const RelayRequest&) { published++; }, 500ms);

    MockResponseWriter writer;
    writer.fail_begin = true;
    auto result = handler.handle(post(R"({"sender_id":"u","chat_id":"c","content":"x"})"), writer);

    REQUIRE(result.outcome == StreamOutcome::TransportError);
    REQUIRE(published == 0);
    REQUIRE(reg.size() == 0);
}

TEST_CASE("InboundRequestHandler: shutdown releases a waiting stream", "[request_handler]") {
    CorrelationRegistry reg;
    InboundRequestHandler handler(reg, [](const RelayRequest&) {}, 10000ms);

    MockResponseWriter writer;
    HandleResult result;
    std::thread request([&] {
        result = handler.handle(post(R"({"sender_id":"u","chat_id":"c","content":"x"})"), writer);
    });

    // Wait for the stream to open, then for the registration to be visible
    REQUIRE(writer.wait_for_chunks(0));
    for (int i = 0; i < 200 && reg.size() == 0; ++i) std::this_thread::sleep_for(5ms);
    REQUIRE(reg.close_all() == 1);
    request.join();

    REQUIRE(result.outcome == StreamOutcome::Cancelled);
    auto events = writer.events();
    REQUIRE(events.size() == 1);
    REQUIRE(sse_event_content(events[0]) == relay_notices::ShuttingDown);
}

TEST_CASE("InboundRequestHandler: concurrent requests never see each other's replies", "[request_handler]") {
    CorrelationRegistry reg;
    OutboundDispatcher dispatcher(reg);
    std::mutex backend_mutex;
    std::vector<std::thread> backend;

    InboundRequestHandler handler(reg, [&](const RelayRequest& r) {
        std::string id = r.request_id;
        std::string content = r.content;
        std::lock_guard<std::mutex> lock(backend_mutex);
        backend.emplace_back([&dispatcher, id, content] {
            dispatcher.deliver(reply(id, "progress:" + content, true));
            std::this_thread::sleep_for(10ms);
            dispatcher.deliver(reply(id, "final:" + content, false));
        });
    }, 2000ms);

    constexpr int kRequests = 8;
    std::vector<MockResponseWriter> writers(kRequests);
    std::vector<HandleResult> results(kRequests);
    std::vector<std::thread> clients;
    for (int i = 0; i < kRequests; ++i) {
        clients.emplace_back([&, i] {
            std::string body = json{{"sender_id", "u"}, {"chat_id", "c"},
                                    {"content", "m" + std::to_string(i)}}.dump();
            results[i] = handler.handle(post(body), writers[i]);
        });
    }
    for (auto& t : clients) t.join();
    {
        std::lock_guard<std::mutex> lock(backend_mutex);
        for (auto& t : backend) t.join();
    }

    for (int i = 0; i < kRequests; ++i) {
        REQUIRE(results[i].outcome == StreamOutcome::Completed);
        auto events = writers[i].events();
        REQUIRE(events.size() == 2);
        REQUIRE(sse_event_content(events[0]) == "progress:m" + std::to_string(i));
        REQUIRE(sse_event_content(events[1]) == "final:m" + std::to_string(i));
    }
    REQUIRE(reg.size() == 0);
}
