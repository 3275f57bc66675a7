// Streaming HTTP client on libcurl's multi interface (non-Linux builds).
#include "http.hpp"

#include <curl/curl.h>
#include <iostream>
#include <string>

namespace tokflow {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

namespace {

// curl drives the transfer only inside read(), i.e. on the reading thread.
class CurlStreamSource : public ByteSource {
public:
    explicit CurlStreamSource(HttpStreamRequest request)
        : request_(std::move(request)) {}

    ~CurlStreamSource() override {
        if (multi_ && easy_) curl_multi_remove_handle(multi_, easy_);
        if (easy_) curl_easy_cleanup(easy_);
        if (multi_) curl_multi_cleanup(multi_);
        curl_slist_free_all(hlist_);
    }

    CurlStreamSource(const CurlStreamSource&) = delete;
    CurlStreamSource& operator=(const CurlStreamSource&) = delete;

    ReadResult read(std::string& out, std::chrono::milliseconds timeout) override {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        if (!started_) start();

        while (true) {
            if (!received_.empty()) {
                out += received_;
                received_.clear();
                return ReadResult::data();
            }
            if (done_) {
                if (!error_.empty()) return ReadResult::failure(error_);
                return ReadResult::eof();
            }

            int running = 0;
            CURLMcode mc = curl_multi_perform(multi_, &running);
            if (mc != CURLM_OK) {
                finish(std::string("curl: ") + curl_multi_strerror(mc));
                continue;
            }
            collect_result();
            if (!received_.empty() || done_) continue;

            auto left = std::chrono::ceil<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return ReadResult::timeout();
            curl_multi_poll(multi_, nullptr, 0, static_cast<int>(left.count()), nullptr);
        }
    }

private:
    static size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
        size_t total = size * nmemb;
        static_cast<CurlStreamSource*>(userdata)->received_.append(ptr, total);
        return total;
    }

    void finish(const std::string& error) {
        if (error_.empty()) error_ = error;
        done_ = true;
    }

    void start() {
        started_ = true;
        multi_ = curl_multi_init();
        easy_ = curl_easy_init();
        if (!multi_ || !easy_) {
            finish("curl initialisation failed");
            return;
        }
        hlist_ = build_headers(request_.headers);
        curl_easy_setopt(easy_, CURLOPT_URL, request_.url.c_str());
        curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, hlist_);
        curl_easy_setopt(easy_, CURLOPT_POST, 1L);
        curl_easy_setopt(easy_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_.body.size()));
        curl_easy_setopt(easy_, CURLOPT_COPYPOSTFIELDS, request_.body.c_str());
        curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT, request_.connect_timeout_seconds);
        curl_easy_setopt(easy_, CURLOPT_TCP_NODELAY, 1L);
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_multi_add_handle(multi_, easy_);
    }

    void collect_result() {
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg != CURLMSG_DONE) continue;
            if (msg->data.result != CURLE_OK) {
                std::cerr << "[http] " << curl_easy_strerror(msg->data.result) << "\n";
                finish(std::string("curl: ") + curl_easy_strerror(msg->data.result));
                continue;
            }
            long status = 0;
            curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status);
            if (status < 200 || status >= 300) {
                finish(describe_http_status(status, received_));
                received_.clear();
            } else {
                done_ = true;
            }
        }
        // Do not pass an error body off as payload.
        if (!received_.empty() && !done_) {
            long status = 0;
            curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status);
            if (status != 0 && (status < 200 || status >= 300)) {
                finish(describe_http_status(status, received_));
                received_.clear();
            }
        }
    }

    HttpStreamRequest request_;
    CURLM* multi_ = nullptr;
    CURL* easy_ = nullptr;
    curl_slist* hlist_ = nullptr;
    std::string received_;
    bool started_ = false;
    bool done_ = false;
    std::string error_;
};

} // namespace

std::unique_ptr<ByteSource> open_http_stream(HttpStreamRequest request) {
    return std::make_unique<CurlStreamSource>(std::move(request));
}

} // namespace tokflow
