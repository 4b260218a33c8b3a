// ─────────────────────────────────────────────────────────────────────────────
// Job Tests
// ─────────────────────────────────────────────────────────────────────────────
// Job state machine: refresh/cancel request counts for every status and
// result availability.

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "starship/api/connection.hpp"
#include "starship/api/job.hpp"
#include "starship/codec/npy.hpp"
#include "mocks/capturing_logger.hpp"
#include "mocks/mock_http_client.hpp"

#include <memory>

using namespace starship;
using namespace starship::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

struct Fixture {
    MockHttpClient* http;
    std::unique_ptr<Connection> connection;

    Fixture() {
        auto mock = std::make_unique<MockHttpClient>();
        http = mock.get();
        connection = std::make_unique<Connection>(ConnectionConfig{}.with_token("abc"), std::move(mock));
    }

    void queue_status(const std::string& id, const std::string& status) {
        http->queue_json_response(200, R"({"id": ")" + id + R"(", "status": ")" + status + R"("})");
    }
};

const NdArray kSamples = NdArray::from_rows({{0, 1, 0, 2, 1, 0, 0, 0}});

}  // namespace

TEST_CASE("Job exposes id and status", "[job]") {
    Fixture f;
    Job job("123", JobStatus::Queued, *f.connection);

    REQUIRE(job.id() == "123");
    REQUIRE(job.status() == JobStatus::Queued);
    REQUIRE_FALSE(job.is_final());
    REQUIRE(job.to_string() == "<Job: id=123, status=queued>");
}

// ═══════════════════════════════════════════════════════════════════════════
// result
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Job result is unavailable before completion", "[job][result]") {
    Fixture f;
    const auto status = GENERATE(JobStatus::Open, JobStatus::Queued,
                                 JobStatus::Cancelled, JobStatus::Failed);
    Job job("123", status, *f.connection);

    auto result = job.result();

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ApiErrorCode::NotCompleted);
    REQUIRE_THAT(result.error().message, ContainsSubstring(std::string(to_string(status))));
    REQUIRE(f.http->request_count() == 0);
}

TEST_CASE("A job constructed as complete has no fetched result", "[job][result]") {
    Fixture f;
    f.queue_status("123", "complete");

    auto job = f.connection->get_job("123");
    REQUIRE(job.has_value());
    REQUIRE(job->status() == JobStatus::Completed);

    auto result = job->result();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ApiErrorCode::NotCompleted);
    REQUIRE_THAT(result.error().message, ContainsSubstring("get_job_result"));
}

// ═══════════════════════════════════════════════════════════════════════════
// refresh
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Refreshing an unfinished job updates its status", "[job][refresh]") {
    Fixture f;
    Job job("123", JobStatus::Open, *f.connection);
    f.queue_status("123", "queued");

    REQUIRE(job.refresh().has_value());

    REQUIRE(job.status() == JobStatus::Queued);
    REQUIRE(f.http->request_count() == 1);
    REQUIRE(f.http->last_request()->path == "/jobs/123");
    REQUIRE_FALSE(job.result().has_value());
}

TEST_CASE("Refreshing into complete fetches the result", "[job][refresh]") {
    Fixture f;
    Job job("123", JobStatus::Queued, *f.connection);
    f.queue_status("123", "complete");
    f.http->queue_npy_response(encode_npy(kSamples));

    REQUIRE(job.refresh().has_value());

    REQUIRE(job.status() == JobStatus::Completed);
    REQUIRE(job.is_final());
    REQUIRE(f.http->request_count() == 2);
    REQUIRE(f.http->requests()[1].path == "/jobs/123/result");

    auto result = job.result();
    REQUIRE(result.has_value());
    REQUIRE(result->samples() == kSamples);
    REQUIRE(result->samples().to_string() == "[[0 1 0 2 1 0 0 0]]");
}

TEST_CASE("Refreshing into failed or cancelled fetches no result", "[job][refresh]") {
    Fixture f;
    const auto status = GENERATE(std::string("failed"), std::string("cancelled"));
    Job job("123", JobStatus::Queued, *f.connection);
    f.queue_status("123", status);

    REQUIRE(job.refresh().has_value());

    REQUIRE(job.is_final());
    REQUIRE(to_string(job.status()) == status);
    REQUIRE(f.http->request_count() == 1);
}

TEST_CASE("A failed refresh leaves the job unchanged", "[job][refresh]") {
    Fixture f;
    Job job("123", JobStatus::Queued, *f.connection);

    SECTION("status request fails") {
        f.http->queue_json_response(500, R"({"status_code": 500, "code": "E1", "detail": "boom"})");

        auto refreshed = job.refresh();

        REQUIRE_FALSE(refreshed.has_value());
        REQUIRE(refreshed.error().message == "Failed to get job: 500 (E1): boom");
    }

    SECTION("result request fails") {
        f.queue_status("123", "complete");
        f.http->queue_connection_error();

        auto refreshed = job.refresh();

        REQUIRE_FALSE(refreshed.has_value());
        REQUIRE(refreshed.error().code == ApiErrorCode::TransportError);
    }

    REQUIRE(job.status() == JobStatus::Queued);
    REQUIRE_FALSE(job.result().has_value());
}

TEST_CASE("Refreshing a final job warns and makes no request", "[job][refresh]") {
    Fixture f;
    ScopedCapture capture(LogLevel::Warn);
    const auto status = GENERATE(JobStatus::Cancelled, JobStatus::Completed, JobStatus::Failed);
    Job job("123", status, *f.connection);

    REQUIRE(job.refresh().has_value());

    REQUIRE(job.status() == status);
    REQUIRE(f.http->request_count() == 0);
    REQUIRE(capture.logger().contains(
        LogLevel::Warn, "A " + std::string(to_string(status)) + " job cannot be refreshed"));
}

// ═══════════════════════════════════════════════════════════════════════════
// cancel
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Cancelling an unfinished job sends one request", "[job][cancel]") {
    Fixture f;
    const auto status = GENERATE(JobStatus::Open, JobStatus::Queued);
    Job job("123", status, *f.connection);
    f.http->queue_response(204);

    REQUIRE(job.cancel().has_value());

    REQUIRE(f.http->request_count(HttpMethod::Patch) == 1);
    REQUIRE(f.http->last_request()->path == "/jobs/123");
    // Local status waits for the next refresh
    REQUIRE(job.status() == status);
}

TEST_CASE("Cancel failures are reported", "[job][cancel]") {
    Fixture f;
    Job job("123", JobStatus::Queued, *f.connection);
    f.http->queue_json_response(400, R"({"status_code": 400, "code": "E2", "detail": "too late"})");

    auto cancelled = job.cancel();

    REQUIRE_FALSE(cancelled.has_value());
    REQUIRE(cancelled.error().message == "Failed to cancel job: 400 (E2): too late");
    REQUIRE(job.status() == JobStatus::Queued);
}

TEST_CASE("Cancelling a final job is an invalid operation", "[job][cancel]") {
    Fixture f;
    const auto status = GENERATE(JobStatus::Cancelled, JobStatus::Completed, JobStatus::Failed);
    Job job("123", status, *f.connection);

    auto cancelled = job.cancel();

    REQUIRE_FALSE(cancelled.has_value());
    REQUIRE(cancelled.error().code == ApiErrorCode::InvalidJobOperation);
    REQUIRE(cancelled.error().message ==
            "A " + std::string(to_string(status)) + " job cannot be cancelled");
    REQUIRE(f.http->request_count() == 0);
}

TEST_CASE("Cancel then refresh observes the cancellation", "[job][cancel]") {
    Fixture f;
    Job job("123", JobStatus::Queued, *f.connection);
    f.http->queue_response(204);
    f.queue_status("123", "cancelled");

    REQUIRE(job.cancel().has_value());
    REQUIRE(job.refresh().has_value());

    REQUIRE(job.status() == JobStatus::Cancelled);
    REQUIRE(f.http->request_count() == 2);
}
