// Linux streaming HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl): http_init/cleanup
// are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"
#include "chunked.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace tokflow {

void http_init() {}
void http_cleanup() {}

namespace {

constexpr size_t kMaxHeaderBytes = 64 * 1024;

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    // Blocking connect + TLS handshake bounded by timeout_secs.
    bool connect(const ParsedUrl& url, long timeout_secs, std::string& error) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) {
            error = "cannot resolve " + url.host + ": " + gai_strerror(gai);
            return false;
        }

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                struct pollfd pfd{fd, POLLOUT, 0};
                rc = ::poll(&pfd, 1, static_cast<int>(timeout_secs * 1000));
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            error = "cannot connect to " + url.host + ":" + url.port;
            return false;
        }

        // Tokens arrive as many tiny writes; do not let Nagle hold them.
        int one = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        set_socket_timeout(timeout_secs);

        if (url.tls) {
            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "TLS context setup failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "TLS session setup failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                error = std::string("TLS handshake failed: ") + buf;
                return false;
            }
        }
        return true;
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    // From here on reads go through poll() with the caller's budget.
    void make_non_blocking() {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    // Wait up to timeout_ms for bytes and append them to `out`.
    // Data with nothing appended means TLS needs more records.
    ReadResult read_some(std::string& out, int timeout_ms) {
        bool buffered = ssl && SSL_pending(ssl) > 0;
        if (!buffered) {
            struct pollfd pfd{fd, POLLIN, 0};
            int rc = ::poll(&pfd, 1, timeout_ms);
            if (rc == 0) return ReadResult::timeout();
            if (rc < 0) {
                if (errno == EINTR) return ReadResult::timeout();
                return ReadResult::failure(std::string("poll failed: ") + std::strerror(errno));
            }
        }

        char buf[4096];
        if (ssl) {
            int n = SSL_read(ssl, buf, static_cast<int>(sizeof(buf)));
            if (n > 0) {
                out.append(buf, static_cast<size_t>(n));
                return ReadResult::data();
            }
            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                return ReadResult::data();
            if (err == SSL_ERROR_ZERO_RETURN) return ReadResult::eof();
            if (err == SSL_ERROR_SYSCALL && errno == 0) return ReadResult::eof();
            return ReadResult::failure("TLS read failed");
        }

        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            return ReadResult::data();
        }
        if (n == 0) return ReadResult::eof();
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return ReadResult::data();
        return ReadResult::failure(std::string("read failed: ") + std::strerror(errno));
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::ceil<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// ── Streaming response source ─────────────────────────────────

class SocketStreamSource : public ByteSource {
public:
    explicit SocketStreamSource(HttpStreamRequest request)
        : request_(std::move(request)) {}

    ReadResult read(std::string& out, std::chrono::milliseconds timeout) override {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        size_t before = out.size();

        if (phase_ == Phase::Idle) open();

        while (phase_ != Phase::Finished) {
            if (body_complete_) {
                phase_ = Phase::Finished;
                break;
            }

            std::string raw;
            ReadResult r = conn_.read_some(raw, remaining_ms(deadline));
            switch (r.status) {
                case ReadStatus::Timeout:
                    return out.size() > before ? ReadResult::data() : r;
                case ReadStatus::Error:
                    finish(r.error);
                    break;
                case ReadStatus::Eof:
                    if (phase_ == Phase::Headers)
                        finish("connection closed before response headers");
                    else if (chunked_ || has_length_)
                        finish("connection closed mid-body"); // framed body cut short
                    else
                        phase_ = Phase::Finished; // read-until-close body ends here
                    break;
                case ReadStatus::Data:
                    if (phase_ == Phase::Headers) {
                        head_ += raw;
                        parse_headers(out);
                    } else {
                        body_bytes(raw, out);
                    }
                    if (out.size() > before) return ReadResult::data();
                    break;
            }
        }

        // Hand over payload first; a failure is reported on the next call.
        if (out.size() > before) return ReadResult::data();
        if (!error_.empty()) return ReadResult::failure(error_);
        return ReadResult::eof();
    }

private:
    enum class Phase { Idle, Headers, Body, Finished };

    void finish(const std::string& error) {
        if (error_.empty()) error_ = error;
        phase_ = Phase::Finished;
    }

    void open() {
        ParsedUrl url;
        try {
            url = parse_url(request_.url);
        } catch (const std::invalid_argument& e) {
            finish(e.what());
            return;
        }

        std::string error;
        if (!conn_.connect(url, request_.connect_timeout_seconds, error)) {
            std::cerr << "[http] " << error << "\n";
            finish(error);
            return;
        }
        std::string req = build_post_request(url, request_.body, request_.headers);
        if (!conn_.write_all(req.c_str(), req.size())) {
            finish("failed to send request to " + url.host);
            return;
        }
        conn_.make_non_blocking();
        phase_ = Phase::Headers;
    }

    // Parse status line + headers once the blank line is in.
    void parse_headers(std::string& out) {
        size_t end = head_.find("\r\n\r\n");
        if (end == std::string::npos) {
            if (head_.size() > kMaxHeaderBytes) finish("response headers too large");
            return;
        }
        std::string leftover = head_.substr(end + 4);
        std::string headers = head_.substr(0, end);
        head_.clear();

        // "HTTP/1.1 200 OK": the three-digit code after the first space
        size_t line_end = headers.find("\r\n");
        std::string status_line = headers.substr(0, line_end);
        size_t sp1 = status_line.find(' ');
        long status = 0;
        if (sp1 != std::string::npos) {
            try { status = std::stol(status_line.substr(sp1 + 1, 3)); }
            catch (const std::exception&) { status = 0; }
        }
        if (status == 0) {
            finish("malformed status line: '" + status_line + "'");
            return;
        }

        size_t pos = (line_end == std::string::npos) ? headers.size() : line_end + 2;
        while (pos < headers.size()) {
            size_t next = headers.find("\r\n", pos);
            if (next == std::string::npos) next = headers.size();
            std::string line = headers.substr(pos, next - pos);
            pos = next + 2;

            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name  = lowercase(line.substr(0, colon));
            std::string value = lowercase(line.substr(colon + 1));
            while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
                value.erase(0, 1);

            if (name == "transfer-encoding") {
                chunked_ = (value.find("chunked") != std::string::npos);
            } else if (name == "content-length") {
                try {
                    content_length_ = std::stoul(value);
                    has_length_ = true;
                } catch (const std::exception&) {
                    has_length_ = false;
                }
            }
        }

        if (status < 200 || status >= 300) {
            finish(describe_http_status(status, leftover));
            return;
        }
        phase_ = Phase::Body;
        if (!chunked_ && has_length_ && content_length_ == 0) body_complete_ = true;
        if (!leftover.empty()) body_bytes(leftover, out);
    }

    void body_bytes(const std::string& raw, std::string& out) {
        if (chunked_) {
            if (!dechunk_.feed(raw, out)) {
                finish("bad chunked encoding: " + dechunk_.error());
                return;
            }
            if (dechunk_.complete()) body_complete_ = true;
        } else if (has_length_) {
            size_t take = std::min(content_length_, raw.size());
            out.append(raw, 0, take);
            content_length_ -= take;
            if (content_length_ == 0) body_complete_ = true;
        } else {
            out += raw; // read until the server closes
        }
    }

    HttpStreamRequest request_;
    Connection conn_;
    Phase phase_ = Phase::Idle;
    std::string head_;
    bool chunked_ = false;
    bool has_length_ = false;
    size_t content_length_ = 0;
    bool body_complete_ = false;
    ChunkedBodyDecoder dechunk_;
    std::string error_;
};

} // namespace

std::unique_ptr<ByteSource> open_http_stream(HttpStreamRequest request) {
    return std::make_unique<SocketStreamSource>(std::move(request));
}

} // namespace tokflow

#endif // __linux__
