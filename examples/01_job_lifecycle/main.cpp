// Example 01: Job Lifecycle
//
// Submit a job, poll it by hand, then read the samples.

#include <starship/api/connection.hpp>
#include <starship/log/spdlog_logger.hpp>

#include <chrono>
#include <iostream>
#include <thread>

using namespace starship;

int main() {
    std::cout << "=== Job Lifecycle Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 1. Connection settings from SF_API_* environment variables
    ConnectionConfig config = config_from_env();
    if (!config.is_valid()) {
        std::cerr << config.validation_error() << "\n";
        std::cerr << "Example: export SF_API_AUTHENTICATION_TOKEN=\"...\"\n";
        return 1;
    }
    Connection connection(config);
    std::cout << connection.to_string() << "\n";

    // 2. Health check
    if (!connection.ping()) {
        std::cerr << "Platform at " << connection.base_url() << " is not reachable\n";
        return 1;
    }

    // 3. Build and submit a two-mode program
    Program program(2);
    program.apply("Dgate", {0.5}, {0})
           .apply("BSgate", {0.7854, 0.0}, {0, 1})
           .apply("MeasureFock", {}, {0, 1});

    auto job = connection.create_job("chip2", program, 10);
    if (!job) {
        std::cerr << "Submission failed: " << job.error().message << "\n";
        return 1;
    }
    std::cout << "Submitted " << job->to_string() << "\n";

    // 4. Poll until the job is final
    while (!job->is_final()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto refreshed = job->refresh();
        if (!refreshed) {
            std::cerr << "Refresh failed: " << refreshed.error().message << "\n";
            return 1;
        }
        std::cout << "  status: " << to_string(job->status()) << "\n";
    }

    // 5. Only a completed job has a result. A job that was already complete
    //    when submitted never fetched one, so download it directly.
    auto result = job->result();
    if (!result && job->status() == JobStatus::Completed) {
        result = connection.get_job_result(job->id());
    }
    if (!result) {
        std::cerr << result.error().message << "\n";
        return 1;
    }
    std::cout << "Samples:\n" << result->samples().to_string() << "\n";
    return 0;
}
