#include "starship/api/connection_config.hpp"
#include "starship/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>

namespace starship {

namespace {

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<bool> parse_bool(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "1" || text == "yes" || text == "on") return true;
    if (text == "false" || text == "0" || text == "no" || text == "off") return false;
    return std::nullopt;
}

std::optional<std::uint16_t> parse_port(const std::string& text) {
    unsigned int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

}  // namespace

ConnectionConfig config_from_env() {
    return config_from_env(ConnectionConfig{});
}

ConnectionConfig config_from_env(ConnectionConfig base) {
    if (auto token = get_env("SF_API_AUTHENTICATION_TOKEN")) {
        base.token = std::move(*token);
    }

    if (auto host = get_env("SF_API_HOSTNAME")) {
        base.host = std::move(*host);
    }

    if (auto port = get_env("SF_API_PORT")) {
        if (auto parsed = parse_port(*port)) {
            base.port = *parsed;
        } else {
            get_logger().warn_fmt("Ignoring invalid SF_API_PORT value '{}'", *port);
        }
    }

    if (auto use_ssl = get_env("SF_API_USE_SSL")) {
        if (auto parsed = parse_bool(*use_ssl)) {
            base.use_ssl = *parsed;
        } else {
            get_logger().warn_fmt("Ignoring invalid SF_API_USE_SSL value '{}'", *use_ssl);
        }
    }

    if (auto debug = get_env("SF_API_DEBUG")) {
        if (auto parsed = parse_bool(*debug)) {
            base.verbose = *parsed;
        } else {
            get_logger().warn_fmt("Ignoring invalid SF_API_DEBUG value '{}'", *debug);
        }
    }

    return base;
}

}  // namespace starship
