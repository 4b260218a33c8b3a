#include "starship/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace starship {

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return std::nullopt;
    }
    const auto& ada_url = parsed.value();

    // ada reports the protocol with its trailing colon ("https:")
    std::string scheme(ada_url.get_protocol());
    if (!scheme.empty() && scheme.back() == ':') {
        scheme.pop_back();
    }
    const bool is_https = (scheme == "https");
    if (scheme != "http" && !is_https) {
        return std::nullopt;
    }

    std::string host(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    // ada drops the port when it equals the scheme default
    std::uint16_t port = is_https ? 443 : 80;
    const std::string_view port_str = ada_url.get_port();
    if (!port_str.empty()) {
        unsigned int value = 0;
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || value > 65535) {
            return std::nullopt;
        }
        port = static_cast<std::uint16_t>(value);
    }

    std::string path(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    return result;
}

}  // namespace starship
