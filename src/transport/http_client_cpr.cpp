#include "starship/transport/http_client.hpp"
#include "starship/log/logger.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>

namespace starship {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (libcurl) backed client. Each call is an independent blocking request;
// the client keeps configuration only, so one instance can serve concurrent
// callers once configured.

class CprHttpClient final : public IHttpClient {
public:
    void set_base_url(const std::string& url) override {
        base_url_ = url;
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
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
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }
        get_logger().debug_fmt("GET {}", *url);

        auto response = cpr::Get(
            cpr::Url{*url},
            build_headers(headers),
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }
        get_logger().debug_fmt("POST {} ({} bytes)", *url, body.size());

        auto request_headers = build_headers(headers);
        request_headers["Content-Type"] = content_type;

        auto response = cpr::Post(
            cpr::Url{*url},
            request_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> patch(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }
        get_logger().debug_fmt("PATCH {} ({} bytes)", *url, body.size());

        auto request_headers = build_headers(headers);
        request_headers["Content-Type"] = content_type;

        auto response = cpr::Patch(
            cpr::Url{*url},
            request_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

private:
    // Job ids are interpolated into request paths, so a path must not be able
    // to step outside the API root or smuggle control bytes into the request.
    static bool is_safe_path(const std::string& path) {
        if (path.empty() || path.front() != '/') {
            return false;
        }
        const bool has_control = std::any_of(path.begin(), path.end(), [](unsigned char c) {
            return c < 0x20 || c == 0x7F;
        });
        if (has_control) {
            return false;
        }

        std::string lower = path;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower.find("..") == std::string::npos &&
               lower.find("%2e") == std::string::npos &&
               lower.find('\\') == std::string::npos;
    }

    HttpClientResult<std::string> build_url(const std::string& path) const {
        if (!is_safe_path(path)) {
            return tl::unexpected(HttpClientError::invalid_request(
                "Rejected unsafe request path: " + path));
        }
        return base_url_ + path;
    }

    cpr::Header build_headers(const HeaderMap& extra_headers) const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
            cpr_headers[name] = value;
        }
        for (const auto& [name, value] : extra_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        get_logger().debug_fmt("<- {} ({} bytes)", result.status_code, result.body.size());
        return result;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        // libcurl reports several distinct certificate failures; its message
        // text is the stable way to recognise them across cpr versions.
        const bool mentions_tls =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos);
        if (mentions_tls || error.code == cpr::ErrorCode::SSL_CONNECT_ERROR) {
            return HttpClientError::ssl_error(msg);
        }
        if (error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            return HttpClientError::timeout(msg);
        }
        return HttpClientError::connection_failed(msg);
    }

    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{30000};
    bool verify_ssl_{true};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace starship
