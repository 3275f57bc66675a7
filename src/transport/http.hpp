#pragma once
#include "byte_source.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tokflow {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpStreamRequest {
    std::string url;
    std::string body;
    std::vector<Header> headers;
    long connect_timeout_seconds = 30;
};

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

// Throws std::invalid_argument for anything but http:// and https:// URLs.
ParsedUrl parse_url(const std::string& url);

// Serialized HTTP/1.1 POST with Host, Content-Length and Connection: close.
std::string build_post_request(const ParsedUrl& url,
                               const std::string& body,
                               const std::vector<Header>& headers);

// Error text for a non-2xx response; quotes at most the first 512 bytes.
std::string describe_http_status(long status, const std::string& body_start);

// POST `request.body` and expose the response body as a ByteSource.
// Nothing touches the network until the first read(), so connecting,
// sending and reading headers all happen on the thread that reads.
// A non-2xx status surfaces as a read Error.
//
// Only one backend is compiled per build target (CMakeLists.txt gates
// the source file): POSIX sockets + OpenSSL on Linux, libcurl elsewhere.
std::unique_ptr<ByteSource> open_http_stream(HttpStreamRequest request);

} // namespace tokflow
