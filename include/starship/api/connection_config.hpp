#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace starship {

// ═══════════════════════════════════════════════════════════════════════════
// Connection Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Everything needed to reach the job platform. The platform expects the raw
// API token in the Authorization header (no "Bearer" prefix).

struct ConnectionConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Platform
    // ─────────────────────────────────────────────────────────────────────────

    /// API authentication token
    std::string token;

    std::string host = "localhost";

    std::uint16_t port{443};

    bool use_ssl{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Transport
    // ─────────────────────────────────────────────────────────────────────────
    // The platform specifies no timeouts; these defaults bound every request.

    std::chrono::milliseconds connect_timeout{10'000};

    std::chrono::milliseconds read_timeout{30'000};

    /// Log successful submissions and cancellations at info level
    bool verbose{false};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder Methods
    // ─────────────────────────────────────────────────────────────────────────

    ConnectionConfig& with_token(const std::string& value) {
        token = value;
        return *this;
    }

    ConnectionConfig& with_host(const std::string& value) {
        host = value;
        return *this;
    }

    ConnectionConfig& with_port(std::uint16_t value) {
        port = value;
        return *this;
    }

    ConnectionConfig& with_ssl(bool enabled) {
        use_ssl = enabled;
        return *this;
    }

    ConnectionConfig& with_connect_timeout(std::chrono::milliseconds timeout) {
        connect_timeout = timeout;
        return *this;
    }

    ConnectionConfig& with_read_timeout(std::chrono::milliseconds timeout) {
        read_timeout = timeout;
        return *this;
    }

    ConnectionConfig& with_verbose(bool enabled) {
        verbose = enabled;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Validation
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_valid() const {
        return validation_error().empty();
    }

    /// Empty when valid
    [[nodiscard]] std::string validation_error() const {
        if (token.empty()) return "API token is required";
        if (host.empty()) return "Host is required";
        if (port == 0) return "Port must be between 1 and 65535";
        return "";
    }

    /// http(s)://host:port
    [[nodiscard]] std::string base_url() const {
        return std::string(use_ssl ? "https" : "http") + "://" + host + ":" + std::to_string(port);
    }
};

/// Defaults overridden by SF_API_AUTHENTICATION_TOKEN, SF_API_HOSTNAME,
/// SF_API_PORT, SF_API_USE_SSL and SF_API_DEBUG. Unparseable values keep
/// the default and are logged as warnings.
[[nodiscard]] ConnectionConfig config_from_env();

/// Same as config_from_env() but starting from `base` instead of defaults.
[[nodiscard]] ConnectionConfig config_from_env(ConnectionConfig base);

}  // namespace starship
