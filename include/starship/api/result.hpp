#pragma once

#include "starship/codec/npy.hpp"

#include <string>

namespace starship {

// ─────────────────────────────────────────────────────────────────────────────
// Result
// ─────────────────────────────────────────────────────────────────────────────
// Samples of a completed job. is_stateful is true only for results of a full
// local-state simulation; results fetched from the platform are sample-only.

class Result {
public:
    explicit Result(NdArray samples, bool is_stateful = false)
        : samples_(std::move(samples))
        , is_stateful_(is_stateful)
    {}

    [[nodiscard]] const NdArray& samples() const noexcept { return samples_; }
    [[nodiscard]] bool is_stateful() const noexcept { return is_stateful_; }

    [[nodiscard]] std::string to_string() const {
        return "<Result: shots=" + std::to_string(samples_.ndim() > 0 ? samples_.shape()[0] : 1)
             + ", stateful=" + (is_stateful_ ? "true" : "false") + ">";
    }

    friend bool operator==(const Result& lhs, const Result& rhs) {
        return lhs.is_stateful_ == rhs.is_stateful_ && lhs.samples_ == rhs.samples_;
    }

private:
    NdArray samples_;
    bool is_stateful_;
};

}  // namespace starship
