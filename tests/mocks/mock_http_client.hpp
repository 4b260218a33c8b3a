#ifndef STARSHIP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define STARSHIP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "starship/transport/http_client.hpp"

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace starship::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient - Test double for IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Tests queue canned status/body pairs (or transport errors) and inspect the
// requests that were made. With nothing queued, requests answer 500 so an
// unexpected call shows up as a failure instead of a silent success.
//
// Connection takes ownership of the client, so tests keep a raw pointer:
//   auto mock = std::make_unique<MockHttpClient>();
//   auto* http = mock.get();
//   Connection connection(config, std::move(mock));

struct RecordedRequest {
    HttpMethod method;
    std::string path;
    std::string body;
    std::string content_type;
    HeaderMap headers;  // default headers merged with per-request headers
};

class MockHttpClient final : public IHttpClient {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup - Queue Responses
    // ─────────────────────────────────────────────────────────────────────────

    void queue_response(int status_code, const std::string& body = "", const HeaderMap& headers = {}) {
        QueuedResponse resp;
        resp.result = HttpClientResponse{status_code, headers, body};
        response_queue_.push_back(std::move(resp));
    }

    void queue_json_response(int status_code, const std::string& body) {
        queue_response(status_code, body, {{"Content-Type", "application/json"}});
    }

    void queue_npy_response(const std::string& bytes) {
        queue_response(200, bytes, {{"Content-Type", std::string(kContentTypeNumpy)}});
    }

    void queue_error(HttpClientError::Code code, const std::string& message) {
        QueuedResponse resp;
        resp.error = HttpClientError{code, message};
        response_queue_.push_back(std::move(resp));
    }

    void queue_connection_error(const std::string& message = "Connection refused") {
        queue_error(HttpClientError::Code::ConnectionFailed, message);
    }

    void queue_timeout(const std::string& message = "Request timed out") {
        queue_error(HttpClientError::Code::Timeout, message);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Verification - Check Requests
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<RecordedRequest>& requests() const {
        return requests_;
    }

    [[nodiscard]] std::size_t request_count() const {
        return requests_.size();
    }

    [[nodiscard]] std::size_t request_count(HttpMethod method) const {
        std::size_t count = 0;
        for (const auto& req : requests_) {
            if (req.method == method) {
                ++count;
            }
        }
        return count;
    }

    [[nodiscard]] std::optional<RecordedRequest> last_request() const {
        if (requests_.empty()) {
            return std::nullopt;
        }
        return requests_.back();
    }

    [[nodiscard]] std::size_t pending_responses() const {
        return response_queue_.size();
    }

    void clear_requests() {
        requests_.clear();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& base_url() const { return base_url_; }
    [[nodiscard]] const HeaderMap& default_headers() const { return default_headers_; }
    [[nodiscard]] std::chrono::milliseconds connect_timeout() const { return connect_timeout_; }
    [[nodiscard]] std::chrono::milliseconds read_timeout() const { return read_timeout_; }
    [[nodiscard]] bool verify_ssl() const { return verify_ssl_; }

    // ─────────────────────────────────────────────────────────────────────────
    // IHttpClient Implementation
    // ─────────────────────────────────────────────────────────────────────────

    void set_base_url(const std::string& url) override {
        base_url_ = url;
    }

    void set_default_headers(const HeaderMap& headers) override {
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> get(
        const std::string& path,
        const HeaderMap& headers = {}
    ) override {
        return make_request(HttpMethod::Get, path, "", "", headers);
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) override {
        return make_request(HttpMethod::Post, path, body, content_type, headers);
    }

    HttpClientResult<HttpClientResponse> patch(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) override {
        return make_request(HttpMethod::Patch, path, body, content_type, headers);
    }

private:
    struct QueuedResponse {
        std::optional<HttpClientResponse> result;
        std::optional<HttpClientError> error;
    };

    HttpClientResult<HttpClientResponse> make_request(
        HttpMethod method,
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers
    ) {
        RecordedRequest req;
        req.method = method;
        req.path = path;
        req.body = body;
        req.content_type = content_type;
        req.headers = headers;
        for (const auto& [k, v] : default_headers_) {
            if (find_header(req.headers, k) == req.headers.end()) {
                req.headers[k] = v;
            }
        }
        requests_.push_back(std::move(req));

        if (response_queue_.empty()) {
            return HttpClientResponse{500, {}, R"({"code": "MOCK", "detail": "no response queued"})"};
        }

        auto queued = std::move(response_queue_.front());
        response_queue_.pop_front();

        if (queued.error.has_value()) {
            return tl::unexpected(*queued.error);
        }
        return *queued.result;
    }

    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{0};
    std::chrono::milliseconds read_timeout_{0};
    bool verify_ssl_{false};

    std::vector<RecordedRequest> requests_;
    std::deque<QueuedResponse> response_queue_;
};

}  // namespace starship::testing

#endif  // STARSHIP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
