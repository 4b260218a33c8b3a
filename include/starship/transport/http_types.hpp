#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace starship {

// ─────────────────────────────────────────────────────────────────────────────
// Header Map
// ─────────────────────────────────────────────────────────────────────────────
// Header names are case-insensitive (RFC 7230); lookups go through
// find_header/get_header rather than HeaderMap::find.

using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────
// The job API uses GET (fetch), POST (create) and PATCH (cancel).

enum class HttpMethod {
    Get,
    Post,
    Patch
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:   return "GET";
        case HttpMethod::Post:  return "POST";
        case HttpMethod::Patch: return "PATCH";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Common Content Types
// ─────────────────────────────────────────────────────────────────────────────

inline constexpr std::string_view kContentTypeJson = "application/json";
inline constexpr std::string_view kContentTypeNumpy = "application/x-numpy";

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port{0};
    std::string path;     // always starts with '/'

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    /// scheme://host:port, without path. Used as the client base URL.
    [[nodiscard]] std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }
};

/// Parse an http(s) URL with ada-url (WHATWG URL standard).
/// Returns nullopt for malformed URLs, other schemes, or an empty host.
[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace starship
