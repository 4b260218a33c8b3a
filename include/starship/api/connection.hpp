#pragma once

#include "starship/api/api_error.hpp"
#include "starship/api/connection_config.hpp"
#include "starship/api/job.hpp"
#include "starship/api/job_status.hpp"
#include "starship/api/result.hpp"
#include "starship/circuit/blackbird.hpp"
#include "starship/transport/http_client.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace starship {

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════
// Performs the job operations of the remote platform and maps each HTTP
// outcome to a domain object or an ApiError:
//
//   create job   POST  /jobs              201  {"circuit": "..."}
//   get job      GET   /jobs/{id}         200  -> {"id", "status"}
//   get result   GET   /jobs/{id}/result  200  -> .npy bytes
//   cancel job   PATCH /jobs/{id}         204  {"status": "cancelled"}
//   health       GET   /healthz           200
//
// A Connection holds configuration only; it keeps no job state and can be
// shared by any number of Jobs. It is neither copyable nor movable because
// Jobs keep a pointer to it.
//
// Example:
//   Connection connection(ConnectionConfig{}.with_token("abc"));
//   if (!connection.ping()) { ... }
//   auto job = connection.create_job("chip2", program, 123);
//   if (job) {
//       job->refresh();
//   }

class Connection {
public:
    /// Uses the default cpr client. Throws std::invalid_argument if the
    /// configured host and port do not form a valid http(s) URL.
    explicit Connection(ConnectionConfig config);

    /// Inject a transport (tests, custom clients).
    Connection(ConnectionConfig config, std::unique_ptr<IHttpClient> client);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& token() const noexcept { return config_.token; }
    [[nodiscard]] const std::string& host() const noexcept { return config_.host; }
    [[nodiscard]] std::uint16_t port() const noexcept { return config_.port; }
    [[nodiscard]] bool use_ssl() const noexcept { return config_.use_ssl; }
    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }
    [[nodiscard]] const ConnectionConfig& config() const noexcept { return config_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Job Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Serialize `program` for `target` with `shots` and submit it.
    [[nodiscard]] ApiResult<Job> create_job(
        const std::string& target, const Program& program, int shots) const;

    /// Submit an already serialized Blackbird circuit.
    [[nodiscard]] ApiResult<Job> create_job(const std::string& circuit) const;

    /// Listing jobs is not available; always NotImplemented.
    [[nodiscard]] ApiResult<std::vector<Job>> get_all_jobs(
        std::chrono::system_clock::time_point after = std::chrono::system_clock::time_point{}) const;

    [[nodiscard]] ApiResult<Job> get_job(const std::string& job_id) const;

    [[nodiscard]] ApiResult<JobStatus> get_job_status(const std::string& job_id) const;

    [[nodiscard]] ApiResult<Result> get_job_result(const std::string& job_id) const;

    [[nodiscard]] ApiResult<void> cancel_job(const std::string& job_id) const;

    /// True iff the health endpoint answers 200. Never fails.
    [[nodiscard]] bool ping() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Helpers
    // ─────────────────────────────────────────────────────────────────────────

    /// "{status_code} ({code}): {detail}" from a JSON error body; missing
    /// fields (or a body that is not a JSON object) become empty strings.
    [[nodiscard]] static std::string format_error_message(const std::string& body);

    /// "<Connection: token=..., host=...>"
    [[nodiscard]] std::string to_string() const;

private:
    [[nodiscard]] ApiResult<Job> parse_job(const HttpClientResponse& response) const;

    ConnectionConfig config_;
    std::string base_url_;
    std::unique_ptr<IHttpClient> http_client_;
};

}  // namespace starship
