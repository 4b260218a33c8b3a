#include "starship/engine/remote_engine.hpp"
#include "starship/log/logger.hpp"

#include <stdexcept>
#include <thread>

namespace starship {

RemoteEngine::RemoteEngine(const Connection& connection, std::string target, EngineOptions options)
    : connection_(&connection)
    , target_(std::move(target))
    , options_(std::move(options))
{
    if (target_.empty()) {
        throw std::invalid_argument("RemoteEngine requires a target device");
    }
    if (options_.shots < 1) {
        throw std::invalid_argument("RemoteEngine requires at least one shot");
    }
    // The timeout is measured in poll intervals, so a zero interval would
    // never reach it.
    if (options_.poll_interval.count() <= 0) {
        throw std::invalid_argument("RemoteEngine poll interval must be positive");
    }
    if (options_.timeout.count() < 0) {
        throw std::invalid_argument("RemoteEngine timeout cannot be negative");
    }
    if (!options_.sleep) {
        options_.sleep = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

ApiResult<Job> RemoteEngine::run_async(const Program& program) const {
    return connection_->create_job(target_, program, options_.shots);
}

ApiResult<Job> RemoteEngine::run_async(const BlackbirdScript& script) const {
    BlackbirdScript submitted = script;
    submitted.with_target(target_, options_.shots);
    return connection_->create_job(submitted.serialize());
}

ApiResult<Result> RemoteEngine::run(const Program& program) const {
    auto job = run_async(program);
    if (!job) {
        return tl::unexpected(job.error());
    }
    return wait(*job);
}

ApiResult<Result> RemoteEngine::run(const BlackbirdScript& script) const {
    auto job = run_async(script);
    if (!job) {
        return tl::unexpected(job.error());
    }
    return wait(*job);
}

ApiResult<Result> RemoteEngine::wait(Job& job) const {
    get_logger().info_fmt("Job {} submitted to {} ({} shots)", job.id(), target_, options_.shots);

    // Elapsed time is the sum of poll intervals, so a replaced sleep
    // function makes the timeout deterministic.
    std::chrono::milliseconds waited{0};
    while (!job.is_final()) {
        if (options_.timeout.count() > 0 && waited >= options_.timeout) {
            return tl::unexpected(ApiError::timeout(
                "Job " + job.id() + " did not finish within "
                + std::to_string(options_.timeout.count()) + " ms (last status: "
                + std::string(to_string(job.status())) + ")"));
        }

        options_.sleep(options_.poll_interval);
        waited += options_.poll_interval;

        auto refreshed = job.refresh();
        if (!refreshed) {
            return tl::unexpected(refreshed.error());
        }
        get_logger().debug_fmt("Job {} is {}", job.id(), to_string(job.status()));
    }

    switch (job.status()) {
        case JobStatus::Completed: {
            get_logger().info_fmt("Job {} completed", job.id());
            auto result = job.result();
            // Completed on submission: refresh() never ran to attach it
            if (!result) {
                return connection_->get_job_result(job.id());
            }
            return result;
        }
        case JobStatus::Cancelled:
            return tl::unexpected(ApiError::job_failed("Job " + job.id() + " was cancelled"));
        default:
            return tl::unexpected(ApiError::job_failed("Job " + job.id() + " failed"));
    }
}

}  // namespace starship
