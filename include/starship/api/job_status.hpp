#pragma once

#include <optional>
#include <string_view>

namespace starship {

// ─────────────────────────────────────────────────────────────────────────────
// JobStatus
// ─────────────────────────────────────────────────────────────────────────────
// Status of a remote job as reported by the platform. Open and Queued are the
// only non-final states; a final status never changes again.

enum class JobStatus {
    Open,
    Queued,
    Cancelled,
    Completed,
    Failed
};

/// Wire representation ("open", "queued", "cancelled", "complete", "failed").
[[nodiscard]] constexpr std::string_view to_string(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Open:      return "open";
        case JobStatus::Queued:    return "queued";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Completed: return "complete";
        case JobStatus::Failed:    return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<JobStatus> parse_job_status(std::string_view text) noexcept {
    if (text == "open")      return JobStatus::Open;
    if (text == "queued")    return JobStatus::Queued;
    if (text == "cancelled") return JobStatus::Cancelled;
    if (text == "complete")  return JobStatus::Completed;
    if (text == "failed")    return JobStatus::Failed;
    return std::nullopt;
}

[[nodiscard]] constexpr bool is_final(JobStatus status) noexcept {
    return status == JobStatus::Cancelled ||
           status == JobStatus::Completed ||
           status == JobStatus::Failed;
}

}  // namespace starship
