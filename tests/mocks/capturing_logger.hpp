#ifndef STARSHIP_TESTS_MOCKS_CAPTURING_LOGGER_HPP
#define STARSHIP_TESTS_MOCKS_CAPTURING_LOGGER_HPP

#include "starship/log/logger.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace starship::testing {

// ─────────────────────────────────────────────────────────────────────────────
// CapturingLogger - records log messages for verification
// ─────────────────────────────────────────────────────────────────────────────

class CapturingLogger final : public ILogger {
public:
    explicit CapturingLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept {
        return records_;
    }

    [[nodiscard]] bool contains(LogLevel level, std::string_view text) const {
        for (const auto& record : records_) {
            if (record.level == level && record.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    void clear() {
        records_.clear();
    }

private:
    LogLevel min_level_;
    std::vector<LogRecord> records_;
};

// Installs a CapturingLogger as the global logger for one scope and restores
// the NullLogger afterwards.
class ScopedCapture {
public:
    explicit ScopedCapture(LogLevel min_level = LogLevel::Trace) {
        auto logger = std::make_unique<CapturingLogger>(min_level);
        logger_ = logger.get();
        set_logger(std::move(logger));
    }

    ~ScopedCapture() {
        set_logger(nullptr);
    }

    ScopedCapture(const ScopedCapture&) = delete;
    ScopedCapture& operator=(const ScopedCapture&) = delete;

    [[nodiscard]] CapturingLogger& logger() const noexcept { return *logger_; }

private:
    CapturingLogger* logger_;
};

}  // namespace starship::testing

#endif  // STARSHIP_TESTS_MOCKS_CAPTURING_LOGGER_HPP
