#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// API Error
// ═══════════════════════════════════════════════════════════════════════════
// Error type shared by Connection, Job and RemoteEngine. Every operation
// reports failure through ApiResult; nothing is retried automatically.

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace starship {

enum class ApiErrorCode {
    RequestFailed,        ///< Server answered with a non-success status code
    InvalidJobOperation,  ///< Operation not allowed in the job's current status
    NotCompleted,         ///< Result read before the job completed
    NotImplemented,       ///< Operation is not available in this client
    TransportError,       ///< No HTTP response (connection, timeout, TLS)
    InvalidResponse,      ///< Success status but undecodable body
    InvalidProgram,       ///< Circuit script could not be parsed
    JobFailed,            ///< Job reached Failed or Cancelled while waiting
    Timeout               ///< Gave up waiting for a job to finish
};

[[nodiscard]] constexpr std::string_view to_string(ApiErrorCode code) noexcept {
    switch (code) {
        case ApiErrorCode::RequestFailed:       return "RequestFailed";
        case ApiErrorCode::InvalidJobOperation: return "InvalidJobOperation";
        case ApiErrorCode::NotCompleted:        return "NotCompleted";
        case ApiErrorCode::NotImplemented:      return "NotImplemented";
        case ApiErrorCode::TransportError:      return "TransportError";
        case ApiErrorCode::InvalidResponse:     return "InvalidResponse";
        case ApiErrorCode::InvalidProgram:      return "InvalidProgram";
        case ApiErrorCode::JobFailed:           return "JobFailed";
        case ApiErrorCode::Timeout:             return "Timeout";
    }
    return "Unknown";
}

struct ApiError {
    ApiErrorCode code;
    std::string message;
    std::optional<int> http_status;  ///< Set for RequestFailed

    [[nodiscard]] static ApiError request_failed(int status, std::string msg) {
        return {ApiErrorCode::RequestFailed, std::move(msg), status};
    }

    [[nodiscard]] static ApiError invalid_job_operation(std::string msg) {
        return {ApiErrorCode::InvalidJobOperation, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ApiError not_completed(std::string msg) {
        return {ApiErrorCode::NotCompleted, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ApiError not_implemented(std::string msg) {
        return {ApiErrorCode::NotImplemented, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ApiError transport_error(std::string msg) {
        return {ApiErrorCode::TransportError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ApiError invalid_response(std::string msg) {
        return {ApiErrorCode::InvalidResponse, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ApiError invalid_program(std::string msg) {
        return {ApiErrorCode::InvalidProgram, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ApiError job_failed(std::string msg) {
        return {ApiErrorCode::JobFailed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ApiError timeout(std::string msg) {
        return {ApiErrorCode::Timeout, std::move(msg), std::nullopt};
    }
};

template <typename T>
using ApiResult = tl::expected<T, ApiError>;

}  // namespace starship
