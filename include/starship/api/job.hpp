#pragma once

#include "starship/api/api_error.hpp"
#include "starship/api/job_status.hpp"
#include "starship/api/result.hpp"

#include <optional>
#include <string>

namespace starship {

class Connection;

// ═══════════════════════════════════════════════════════════════════════════
// Job
// ═══════════════════════════════════════════════════════════════════════════
// A job on the remote platform. The local status is a cache of what the
// server last reported: only refresh() changes it, and cancel() does not
// touch it. refresh() attaches the result on the transition into Completed.
//
// A job that Connection::get_job or create_job returns already Completed has
// no result attached: result() reports NotCompleted until the samples are
// fetched with Connection::get_job_result (RemoteEngine does this itself).
//
// Jobs are normally obtained from Connection::create_job or
// Connection::get_job. The Connection is borrowed and must outlive the Job.
// A Job is not synchronized; give each Job a single owner.

class Job {
public:
    Job(std::string id, JobStatus status, const Connection& connection);

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    [[nodiscard]] JobStatus status() const noexcept { return status_; }

    [[nodiscard]] bool is_final() const noexcept { return starship::is_final(status_); }

    /// The job result; NotCompleted unless status() == Completed and the
    /// result was attached by refresh().
    [[nodiscard]] ApiResult<Result> result() const;

    /// Fetch the current status and, on the transition into Completed, the
    /// result. On a final job this logs a warning and makes no request.
    /// On failure the job is left unchanged.
    ApiResult<void> refresh();

    /// Ask the platform to cancel the job. InvalidJobOperation on a final job.
    /// The local status only changes on a later refresh().
    ApiResult<void> cancel();

    [[nodiscard]] const Connection& connection() const noexcept { return *connection_; }

    /// "<Job: id=..., status=...>"
    [[nodiscard]] std::string to_string() const;

private:
    std::string id_;
    JobStatus status_;
    std::optional<Result> result_;
    const Connection* connection_;
};

}  // namespace starship
