#include "channels/http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <nlohmann/json.hpp>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace relaygate {

static constexpr size_t kMaxHeaderBytes = 16384;

// ── URL helpers ───────────────────────────────────────────────────────────────

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            char* end;
            long val = std::strtol(hex, &end, 16);
            if (end == hex + 2) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        } else if (s[i] == '+') {
            out += ' ';
            continue;
        }
        out += s[i];
    }
    return out;
}

static std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> result;
    size_t start = 0;
    while (start <= qs.size()) {
        size_t amp = qs.find('&', start);
        if (amp == std::string::npos) amp = qs.size();
        std::string pair = qs.substr(start, amp - start);
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else if (!pair.empty()) {
            result[url_decode(pair)] = "";
        }
        start = amp + 1;
    }
    return result;
}

std::string ServerRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

std::string ServerRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

// ── Parsing ───────────────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string port_str = addr.substr(pos + 1);
    if (port_str.empty()) return false;
    for (char c : port_str) {
        if (c < '0' || c > '9') return false;
    }
    if (port_str.size() > 5) return false;
    int p = std::atoi(port_str.c_str());
    if (p < 0 || p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

bool parse_request_head(const std::string& head, ServerRequest& req) {
    auto rl_end = head.find("\r\n");
    std::string request_line = rl_end == std::string::npos ? head : head.substr(0, rl_end);

    {
        std::istringstream ss(request_line);
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) return false;
        if (ver.rfind("HTTP/", 0) != 0) return false;
        auto q = pq.find('?');
        if (q != std::string::npos) {
            req.path         = pq.substr(0, q);
            req.query_params = parse_query_string(pq.substr(q + 1));
        } else {
            req.path = pq;
        }
    }

    if (rl_end == std::string::npos) return true;

    size_t pos = rl_end + 2;
    while (pos < head.size()) {
        auto ne = head.find("\r\n", pos);
        if (ne == std::string::npos) ne = head.size();
        std::string hline = head.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }
    return true;
}

const char* status_reason(int status) {
    switch (status) {
        case 100: return "Continue";
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

static void send_error(ResponseWriter& writer, int status, const std::string& message) {
    if (!writer.send({status, "application/json", nlohmann::json{{"error", message}}.dump()})) {
        log_debug("http_server", "Client went away before " + std::to_string(status) + " response");
    }
}

// ── ChunkedBodyDecoder ────────────────────────────────────────────────────────

static constexpr size_t kMaxChunkLine = 1024;

ChunkedBodyDecoder::Status ChunkedBodyDecoder::feed(const char* data, size_t len) {
    if (stage_ == Stage::Finished) return Status::Done;
    buf_.append(data, len);
    return advance();
}

ChunkedBodyDecoder::Status ChunkedBodyDecoder::advance() {
    size_t pos = 0;
    Status result = Status::NeedMore;
    for (;;) {
        if (stage_ == Stage::Size) {
            auto eol = buf_.find("\r\n", pos);
            if (eol == std::string::npos) {
                if (buf_.size() - pos > kMaxChunkLine) result = Status::Malformed;
                break;
            }
            std::string line = buf_.substr(pos, eol - pos);
            pos = eol + 2;
            auto semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            line = trim(line);
            if (line.empty() || line.size() > 16 ||
                line.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
                result = Status::Malformed;
                break;
            }
            size_t size = std::stoull(line, nullptr, 16);
            if (size > max_body_ - body_.size()) {
                result = Status::TooLarge;
                break;
            }
            if (size == 0) {
                stage_ = Stage::Trailer;
            } else {
                remaining_ = size;
                stage_ = Stage::Data;
            }
        } else if (stage_ == Stage::Data) {
            size_t n = std::min(remaining_, buf_.size() - pos);
            if (n == 0) break;
            body_.append(buf_, pos, n);
            pos += n;
            remaining_ -= n;
            if (remaining_ == 0) stage_ = Stage::DataEnd;
        } else if (stage_ == Stage::DataEnd) {
            if (buf_.size() - pos < 2) break;
            if (buf_.compare(pos, 2, "\r\n") != 0) {
                result = Status::Malformed;
                break;
            }
            pos += 2;
            stage_ = Stage::Size;
        } else if (stage_ == Stage::Trailer) {
            auto eol = buf_.find("\r\n", pos);
            if (eol == std::string::npos) {
                if (buf_.size() - pos > kMaxHeaderBytes) result = Status::Malformed;
                break;
            }
            bool blank = eol == pos;
            pos = eol + 2;
            if (blank) {
                stage_ = Stage::Finished;
                result = Status::Done;
                break;
            }
        } else {
            result = Status::Done;
            break;
        }
    }
    buf_.erase(0, pos);
    return result;
}

// ── SocketResponseWriter ──────────────────────────────────────────────────────

bool SocketResponseWriter::send_all(const std::string& data) {
    if (failed_) return false;
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            failed_ = true;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool SocketResponseWriter::send(const ServerResponse& resp) {
    if (committed_) return false;
    committed_ = true;
    std::string out =
        "HTTP/1.1 " + std::to_string(resp.status) + " " + status_reason(resp.status) + "\r\n"
        "Content-Type: " + resp.content_type + "\r\n"
        "Content-Length: " + std::to_string(resp.body.size()) + "\r\n"
        "Connection: close\r\n\r\n" + resp.body;
    return send_all(out);
}

bool SocketResponseWriter::begin_stream(int status, const ResponseHeaders& headers) {
    if (committed_) return false;
    committed_ = true;
    streaming_ = true;
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + status_reason(status) + "\r\n";
    for (const auto& h : headers) {
        out += h.first + ": " + h.second + "\r\n";
    }
    out += "Transfer-Encoding: chunked\r\n\r\n";
    return send_all(out);
}

bool SocketResponseWriter::write_chunk(const std::string& data) {
    if (!streaming_) return false;
    if (data.empty()) return !failed_;  // a zero-length chunk would end the body
    char size_line[20];
    std::snprintf(size_line, sizeof(size_line), "%zx\r\n", data.size());
    return send_all(size_line + data + "\r\n");
}

bool SocketResponseWriter::end_stream() {
    if (!streaming_) return false;
    streaming_ = false;
    return send_all("0\r\n\r\n");
}

bool SocketResponseWriter::peer_closed() const {
    if (failed_) return true;
    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
#ifdef POLLRDHUP
    pfd.events |= POLLRDHUP;
#endif
    int rc = ::poll(&pfd, 1, 0);
    if (rc <= 0) return false;
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) return true;
#ifdef POLLRDHUP
    if (pfd.revents & POLLRDHUP) return true;
#endif
    if (pfd.revents & POLLIN) {
        // Readable with nothing to read means orderly shutdown by the peer.
        char c;
        ssize_t n = ::recv(fd_, &c, 1, MSG_PEEK | MSG_DONTWAIT);
        return n == 0;
    }
    return false;
}

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::close_listener() {
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

bool HttpServer::start(std::string& error) {
    if (running_.load()) return true;

    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        shutdown_pipe_[0] = shutdown_pipe_[1] = -1;
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        close_listener();
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        close_listener();
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close_listener();
        return false;
    }

    if (::listen(server_fd_, 64) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close_listener();
        return false;
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t n = ::write(shutdown_pipe_[1], &b, 1);
        (void)n;  // the poll timeout below still ends the loop
    }
    if (thread_.joinable()) thread_.join();
    close_listener();

    // Unblock workers still reading a request; responses may still be written.
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& conn : connections_) {
            if (conn.fd >= 0) ::shutdown(conn.fd, SHUT_RD);
        }
    }
    // The accept thread is gone, so nothing else touches the list now.
    // Workers take the mutex on exit; it must not be held while joining.
    for (auto& conn : connections_) {
        if (conn.thread.joinable()) conn.thread.join();
    }
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.clear();
}

size_t HttpServer::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    size_t n = 0;
    for (const auto& conn : connections_) {
        if (!conn.done) ++n;
    }
    return n;
}

void HttpServer::reap_finished() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->done) {
            if (it->thread.joinable()) it->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        reap_finished();
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval rtv{10, 0};  // 10s recv timeout for the request
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &rtv, sizeof(rtv));
        struct timeval stv{30, 0};  // a stalled reader counts as disconnected
        ::setsockopt(cfd, SOL_SOCKET, SO_SNDTIMEO, &stv, sizeof(stv));
        int one = 1;
        ::setsockopt(cfd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
#ifdef SO_NOSIGPIPE
        ::setsockopt(cfd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif

        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.emplace_back();
        Connection* conn = &connections_.back();
        conn->fd = cfd;
        try {
            conn->thread = std::thread([this, conn]() { serve_connection(conn); });
        } catch (const std::system_error& e) {
            std::cerr << "[http_server] Failed to spawn worker: " << e.what() << "\n";
            ::close(cfd);
            connections_.pop_back();
        }
    }
}

void HttpServer::serve_connection(Connection* conn) {
    handle_connection(conn->fd);
    std::lock_guard<std::mutex> lock(connections_mutex_);
    ::close(conn->fd);
    conn->fd = -1;
    conn->done = true;
}

void HttpServer::handle_connection(int fd) const {
    SocketResponseWriter writer(fd);

    // Read until end-of-headers (CRLFCRLF), capped.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > kMaxHeaderBytes) {
            send_error(writer, 400, "Headers too large");
            return;
        }
    }

    auto hdr_end = buf.find("\r\n\r\n");
    ServerRequest req;
    if (!parse_request_head(buf.substr(0, hdr_end), req)) {
        send_error(writer, 400, "Malformed request");
        return;
    }
    std::string leftover = buf.substr(hdr_end + 4);
    const bool expect_continue = to_lower(req.header("expect")) == "100-continue";
    const std::string cont = "HTTP/1.1 100 Continue\r\n\r\n";

    std::string te = to_lower(req.header("transfer-encoding"));
    if (!te.empty() && te != "identity") {
        if (te != "chunked") {
            send_error(writer, 501, "Unsupported Transfer-Encoding");
            return;
        }
        ChunkedBodyDecoder decoder(max_body_);
        auto status = decoder.feed(leftover);
        if (status == ChunkedBodyDecoder::Status::NeedMore && expect_continue) {
            if (::send(fd, cont.data(), cont.size(), MSG_NOSIGNAL) < 0) return;
        }
        while (status == ChunkedBodyDecoder::Status::NeedMore) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return;  // client went away mid-body
            status = decoder.feed(tmp, static_cast<size_t>(n));
        }
        if (status == ChunkedBodyDecoder::Status::TooLarge) {
            send_error(writer, 413, "Payload too large");
            return;
        }
        if (status == ChunkedBodyDecoder::Status::Malformed) {
            send_error(writer, 400, "Malformed chunked body");
            return;
        }
        req.body = decoder.take_body();
    } else {
        size_t content_len = 0;
        std::string cl = req.header("content-length");
        if (!cl.empty()) {
            try {
                content_len = std::stoul(cl);
            } catch (const std::exception&) {
                send_error(writer, 400, "Invalid Content-Length");
                return;
            }
        }
        if (content_len > max_body_) {
            send_error(writer, 413, "Payload too large");
            return;
        }

        if (content_len > leftover.size() && expect_continue) {
            if (::send(fd, cont.data(), cont.size(), MSG_NOSIGNAL) < 0) return;
        }

        req.body = std::move(leftover);
        while (req.body.size() < content_len) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return;  // client went away mid-body
            req.body.append(tmp, static_cast<size_t>(n));
        }
        if (req.body.size() > content_len) req.body.resize(content_len);
    }

    try {
        handler_(req, writer);
    } catch (const std::exception& e) {
        std::cerr << "[http_server] Handler error on " << req.method << " "
                  << req.path << ": " << e.what() << "\n";
        if (!writer.committed()) {
            send_error(writer, 500, "Internal error");
        }
        return;
    }

    if (!writer.committed()) {
        send_error(writer, 500, "No response");
    }
}

} // namespace relaygate
