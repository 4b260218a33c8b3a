#pragma once

#include "starship/api/api_error.hpp"
#include "starship/api/connection.hpp"
#include "starship/api/job.hpp"
#include "starship/api/result.hpp"
#include "starship/circuit/blackbird.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace starship {

// ─────────────────────────────────────────────────────────────────────────────
// Engine Options
// ─────────────────────────────────────────────────────────────────────────────

struct EngineOptions {
    int shots{1};

    /// Delay before each status request while waiting for a job; must be
    /// positive
    std::chrono::milliseconds poll_interval{1000};

    /// Give up waiting after this long; zero waits forever
    std::chrono::milliseconds timeout{0};

    /// Replaced in tests; defaults to std::this_thread::sleep_for
    std::function<void(std::chrono::milliseconds)> sleep;

    EngineOptions& with_shots(int value) {
        shots = value;
        return *this;
    }

    EngineOptions& with_poll_interval(std::chrono::milliseconds interval) {
        poll_interval = interval;
        return *this;
    }

    EngineOptions& with_timeout(std::chrono::milliseconds value) {
        timeout = value;
        return *this;
    }

    EngineOptions& with_sleep(std::function<void(std::chrono::milliseconds)> fn) {
        sleep = std::move(fn);
        return *this;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// RemoteEngine
// ═══════════════════════════════════════════════════════════════════════════
// Runs programs on one target device through a borrowed Connection.
// run() blocks, polling the job once per poll interval until it is final.
// Polling never retries a failed request: the first error is returned.
//
// Example:
//   Connection connection(config_from_env());
//   RemoteEngine engine(connection, "chip2", EngineOptions{}.with_shots(10));
//   auto result = engine.run(program);

class RemoteEngine {
public:
    /// Throws std::invalid_argument for an empty target, shots < 1, a poll
    /// interval that is not positive or a negative timeout.
    RemoteEngine(const Connection& connection, std::string target, EngineOptions options = {});

    [[nodiscard]] const std::string& target() const noexcept { return target_; }
    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

    /// Submit without waiting.
    [[nodiscard]] ApiResult<Job> run_async(const Program& program) const;

    /// Submit an already serialized circuit without waiting.
    [[nodiscard]] ApiResult<Job> run_async(const BlackbirdScript& script) const;

    /// Submit and wait for the result. JobFailed if the job fails or is
    /// cancelled, Timeout if options().timeout elapses first.
    [[nodiscard]] ApiResult<Result> run(const Program& program) const;

    [[nodiscard]] ApiResult<Result> run(const BlackbirdScript& script) const;

    /// Wait for an already submitted job.
    [[nodiscard]] ApiResult<Result> wait(Job& job) const;

private:
    const Connection* connection_;
    std::string target_;
    EngineOptions options_;
};

}  // namespace starship
