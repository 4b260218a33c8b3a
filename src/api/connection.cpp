#include "starship/api/connection.hpp"
#include "starship/codec/npy.hpp"
#include "starship/log/logger.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace starship {

using Json = nlohmann::json;

namespace {

constexpr const char* kJobsPath = "/jobs";
constexpr const char* kHealthPath = "/healthz";

std::string job_path(const std::string& job_id) {
    return std::string(kJobsPath) + "/" + job_id;
}

ApiError from_client_error(const HttpClientError& error) {
    return ApiError::transport_error(
        std::string(to_string(error.code)) + ": " + error.message);
}

// Renders a JSON scalar the way it appears in a message: strings unquoted,
// numbers and booleans as written, null/absent as empty.
std::string field_text(const Json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

Connection::Connection(ConnectionConfig config)
    : Connection(std::move(config), make_http_client())
{}

Connection::Connection(ConnectionConfig config, std::unique_ptr<IHttpClient> client)
    : config_(std::move(config))
    , http_client_(std::move(client))
{
    if (!http_client_) {
        throw std::invalid_argument("Connection requires an HTTP client");
    }

    const auto url = parse_url(config_.base_url());
    if (!url) {
        throw std::invalid_argument("Invalid platform address: " + config_.base_url());
    }
    base_url_ = url->origin();

    http_client_->set_base_url(base_url_);
    http_client_->set_default_headers({{"Authorization", config_.token}});
    http_client_->set_connect_timeout(config_.connect_timeout);
    http_client_->set_read_timeout(config_.read_timeout);
    http_client_->set_verify_ssl(config_.use_ssl);

    get_logger().debug_fmt("Connection configured for {}", base_url_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Job Operations
// ─────────────────────────────────────────────────────────────────────────────

ApiResult<Job> Connection::create_job(
    const std::string& target, const Program& program, int shots) const
{
    return create_job(to_blackbird(program, target, shots));
}

ApiResult<Job> Connection::create_job(const std::string& circuit) const {
    const Json payload = {{"circuit", circuit}};

    auto response = http_client_->post(kJobsPath, payload.dump(), std::string(kContentTypeJson));
    if (!response) {
        return tl::unexpected(from_client_error(response.error()));
    }

    if (response->status_code == 201) {
        auto job = parse_job(*response);
        if (job && config_.verbose) {
            STARSHIP_LOG_INFO("The job was successfully submitted.");
        }
        return job;
    }
    return tl::unexpected(ApiError::request_failed(
        response->status_code,
        "Failed to create job: " + format_error_message(response->body)));
}

ApiResult<std::vector<Job>> Connection::get_all_jobs(
    std::chrono::system_clock::time_point /*after*/) const
{
    return tl::unexpected(ApiError::not_implemented("This feature is not yet implemented"));
}

ApiResult<Job> Connection::get_job(const std::string& job_id) const {
    auto response = http_client_->get(job_path(job_id));
    if (!response) {
        return tl::unexpected(from_client_error(response.error()));
    }

    if (response->status_code == 200) {
        return parse_job(*response);
    }
    return tl::unexpected(ApiError::request_failed(
        response->status_code,
        "Failed to get job: " + format_error_message(response->body)));
}

ApiResult<JobStatus> Connection::get_job_status(const std::string& job_id) const {
    return get_job(job_id).map([](const Job& job) { return job.status(); });
}

ApiResult<Result> Connection::get_job_result(const std::string& job_id) const {
    const HeaderMap headers{{"Accept", std::string(kContentTypeNumpy)}};

    auto response = http_client_->get(job_path(job_id) + "/result", headers);
    if (!response) {
        return tl::unexpected(from_client_error(response.error()));
    }

    if (response->status_code != 200) {
        return tl::unexpected(ApiError::request_failed(
            response->status_code,
            "Failed to get job result: " + format_error_message(response->body)));
    }

    auto samples = decode_npy(response->body);
    if (!samples) {
        return tl::unexpected(ApiError::invalid_response(
            "Failed to decode result of job " + job_id + ": " + samples.error().message));
    }
    return Result(std::move(*samples), false);
}

ApiResult<void> Connection::cancel_job(const std::string& job_id) const {
    const Json payload = {{"status", std::string(starship::to_string(JobStatus::Cancelled))}};

    auto response = http_client_->patch(
        job_path(job_id), payload.dump(), std::string(kContentTypeJson));
    if (!response) {
        return tl::unexpected(from_client_error(response.error()));
    }

    if (response->status_code == 204) {
        if (config_.verbose) {
            STARSHIP_LOG_INFO("The job was successfully cancelled.");
        }
        return {};
    }
    return tl::unexpected(ApiError::request_failed(
        response->status_code,
        "Failed to cancel job: " + format_error_message(response->body)));
}

bool Connection::ping() const {
    auto response = http_client_->get(kHealthPath);
    if (!response) {
        get_logger().debug_fmt("Health check failed: {}", response.error().message);
        return false;
    }
    return response->status_code == 200;
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

ApiResult<Job> Connection::parse_job(const HttpClientResponse& response) const {
    const Json body = Json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return tl::unexpected(ApiError::invalid_response("Job response is not a JSON object"));
    }

    const auto id = body.find("id");
    const auto status = body.find("status");
    if (id == body.end() || !id->is_string() || status == body.end() || !status->is_string()) {
        return tl::unexpected(ApiError::invalid_response(
            "Job response must contain string fields 'id' and 'status'"));
    }

    const auto parsed = parse_job_status(status->get<std::string>());
    if (!parsed) {
        return tl::unexpected(ApiError::invalid_response(
            "Unknown job status '" + status->get<std::string>() + "'"));
    }
    return Job(id->get<std::string>(), *parsed, *this);
}

std::string Connection::format_error_message(const std::string& body) {
    Json parsed = Json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        parsed = Json::object();
    }
    return field_text(parsed, "status_code") + " (" + field_text(parsed, "code") + "): "
         + field_text(parsed, "detail");
}

std::string Connection::to_string() const {
    return "<Connection: token=" + config_.token + ", host=" + config_.host + ">";
}

}  // namespace starship
