#include <catch2/catch_test_macros.hpp>

#include "starship/api/job_status.hpp"

using namespace starship;

TEST_CASE("JobStatus wire names", "[job_status]") {
    REQUIRE(to_string(JobStatus::Open) == "open");
    REQUIRE(to_string(JobStatus::Queued) == "queued");
    REQUIRE(to_string(JobStatus::Cancelled) == "cancelled");
    REQUIRE(to_string(JobStatus::Completed) == "complete");
    REQUIRE(to_string(JobStatus::Failed) == "failed");
}

TEST_CASE("parse_job_status inverts to_string", "[job_status]") {
    for (const auto status : {JobStatus::Open, JobStatus::Queued, JobStatus::Cancelled,
                              JobStatus::Completed, JobStatus::Failed}) {
        REQUIRE(parse_job_status(to_string(status)) == status);
    }
}

TEST_CASE("parse_job_status rejects unknown text", "[job_status]") {
    REQUIRE_FALSE(parse_job_status("completed").has_value());
    REQUIRE_FALSE(parse_job_status("OPEN").has_value());
    REQUIRE_FALSE(parse_job_status("").has_value());
}

TEST_CASE("Only cancelled, complete and failed are final", "[job_status]") {
    STATIC_REQUIRE_FALSE(is_final(JobStatus::Open));
    STATIC_REQUIRE_FALSE(is_final(JobStatus::Queued));
    STATIC_REQUIRE(is_final(JobStatus::Cancelled));
    STATIC_REQUIRE(is_final(JobStatus::Completed));
    STATIC_REQUIRE(is_final(JobStatus::Failed));
}
