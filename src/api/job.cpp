#include "starship/api/job.hpp"
#include "starship/api/connection.hpp"
#include "starship/log/logger.hpp"

namespace starship {

Job::Job(std::string id, JobStatus status, const Connection& connection)
    : id_(std::move(id))
    , status_(status)
    , connection_(&connection)
{}

ApiResult<Result> Job::result() const {
    if (status_ != JobStatus::Completed) {
        return tl::unexpected(ApiError::not_completed(
            "The result is undefined for jobs that are not completed (current status: "
            + std::string(starship::to_string(status_)) + ")"));
    }
    // A job looked up with get_job() may already be complete without having
    // gone through refresh(); its samples were never downloaded.
    if (!result_) {
        return tl::unexpected(ApiError::not_completed(
            "The result of job " + id_ + " has not been fetched; use Connection::get_job_result"));
    }
    return *result_;
}

ApiResult<void> Job::refresh() {
    if (is_final()) {
        get_logger().warn_fmt("A {} job cannot be refreshed", starship::to_string(status_));
        return {};
    }

    auto status = connection_->get_job_status(id_);
    if (!status) {
        return tl::unexpected(status.error());
    }

    if (*status == JobStatus::Completed) {
        auto result = connection_->get_job_result(id_);
        if (!result) {
            return tl::unexpected(result.error());
        }
        result_ = std::move(*result);
    }
    status_ = *status;
    return {};
}

ApiResult<void> Job::cancel() {
    if (is_final()) {
        return tl::unexpected(ApiError::invalid_job_operation(
            "A " + std::string(starship::to_string(status_)) + " job cannot be cancelled"));
    }
    return connection_->cancel_job(id_);
}

std::string Job::to_string() const {
    return "<Job: id=" + id_ + ", status=" + std::string(starship::to_string(status_)) + ">";
}

}  // namespace starship
