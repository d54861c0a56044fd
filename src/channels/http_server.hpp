#pragma once
#include <string>
#include <functional>
#include <list>
#include <map>
#include <mutex>
#include <atomic>
#include <thread>
#include <utility>
#include <vector>
#include <cstdint>

namespace relaygate {

// A parsed inbound HTTP request.
struct ServerRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // e.g. "/message"
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;

    // Return a header value (name matched case-insensitively), or "" if absent.
    std::string header(const std::string& name) const;
};

// A complete, non-streamed response.
struct ServerResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

using ResponseHeaders = std::vector<std::pair<std::string, std::string>>;

// Output side of one connection. A handler either sends one complete
// response, or begins a stream, writes chunks and ends it. Every method
// returns false once the peer is gone; nothing is retried.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual bool send(const ServerResponse& resp) = 0;

    // Send status line + headers for a chunked response.
    virtual bool begin_stream(int status, const ResponseHeaders& headers) = 0;

    // Send one chunk and flush it to the socket immediately.
    virtual bool write_chunk(const std::string& data) = 0;

    // Send the terminating zero-length chunk.
    virtual bool end_stream() = 0;

    // True once a status line has gone out (no other response is possible).
    virtual bool committed() const = 0;

    // True if the peer has hung up. Lets a stream that is waiting between
    // writes notice a departed caller; never blocks.
    virtual bool peer_closed() const { return false; }
};

// ResponseWriter over a connected socket, using chunked transfer encoding
// for streams.
class SocketResponseWriter : public ResponseWriter {
public:
    explicit SocketResponseWriter(int fd) : fd_(fd) {}

    bool send(const ServerResponse& resp) override;
    bool begin_stream(int status, const ResponseHeaders& headers) override;
    bool write_chunk(const std::string& data) override;
    bool end_stream() override;
    bool committed() const override { return committed_; }
    bool peer_closed() const override;

private:
    bool send_all(const std::string& data);

    int  fd_;
    bool committed_ = false;
    bool streaming_ = false;
    bool failed_    = false;
};

// Minimal threaded TCP HTTP/1.1 server. Designed to sit behind a reverse
// proxy on a private address. Each accepted connection carries one request
// and is served on its own worker thread, so a long-lived streamed response
// never holds up other callers. The accept loop runs in a background thread.
class HttpServer {
public:
    using Handler = std::function<void(const ServerRequest&, ResponseWriter&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:18790"; port 0 binds an
    //              ephemeral port (see port()).
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind, listen and start the accept thread. Returns false and populates
    // error on failure; the server is then left fully stopped.
    bool start(std::string& error);

    // Stop accepting, shut down reads on live connections and join every
    // worker. Handlers blocked on anything other than socket reads must be
    // released by their owner first. Idempotent.
    void stop();

    bool running() const { return running_.load(); }

    // Port actually bound (after start()).
    uint16_t port() const { return bound_port_; }

    // Number of connections currently being served.
    size_t active_connections() const;

private:
    struct Connection {
        int fd = -1;
        bool done = false;
        std::thread thread;
    };

    void accept_loop();
    void serve_connection(Connection* conn);
    void handle_connection(int fd) const;
    void reap_finished();
    void close_listener();

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex connections_mutex_;
    std::list<Connection> connections_;
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range. Port 0 is accepted.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Parse a request line + header block (without the trailing CRLFCRLF).
// Returns false if the request line is malformed.
bool parse_request_head(const std::string& head, ServerRequest& req);

// Incremental decoder for a request body sent with Transfer-Encoding:
// chunked. Chunk extensions and trailer fields are accepted and dropped.
class ChunkedBodyDecoder {
public:
    enum class Status {
        NeedMore,   // feed more bytes
        Done,       // last chunk and trailers seen; bytes after them are ignored
        Malformed,
        TooLarge,   // decoded body would exceed max_body
    };

    explicit ChunkedBodyDecoder(size_t max_body) : max_body_(max_body) {}

    Status feed(const char* data, size_t len);
    Status feed(const std::string& data) { return feed(data.data(), data.size()); }

    std::string take_body() { return std::move(body_); }

private:
    enum class Stage { Size, Data, DataEnd, Trailer, Finished };

    Status advance();

    size_t max_body_;
    std::string buf_;
    std::string body_;
    Stage stage_ = Stage::Size;
    size_t remaining_ = 0;
};

// "Bad Request" for 400, etc. Unknown codes map to "Unknown".
const char* status_reason(int status);

} // namespace relaygate
