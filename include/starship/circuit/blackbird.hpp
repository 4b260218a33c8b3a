#pragma once

#include "starship/api/api_error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace starship {

// ─────────────────────────────────────────────────────────────────────────────
// Program
// ─────────────────────────────────────────────────────────────────────────────
// A photonic circuit built in code: an ordered list of gates and
// measurements acting on numbered modes.

struct Operation {
    std::string name;            // e.g. "Dgate", "MeasureFock"
    std::vector<double> params;
    std::vector<int> modes;
};

class Program {
public:
    explicit Program(std::size_t num_modes, std::string name = "starship_program");

    /// Append an operation. Throws std::invalid_argument for an empty name,
    /// no modes, or a mode outside [0, num_modes).
    Program& apply(std::string op, std::vector<double> params, std::vector<int> modes);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& version() const noexcept { return version_; }
    [[nodiscard]] std::size_t num_modes() const noexcept { return num_modes_; }
    [[nodiscard]] const std::vector<Operation>& operations() const noexcept { return operations_; }

private:
    std::string name_;
    std::string version_ = "1.0";
    std::size_t num_modes_;
    std::vector<Operation> operations_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Blackbird Script
// ─────────────────────────────────────────────────────────────────────────────
// Text form sent to the platform as the job "circuit":
//
//   name <name>
//   version <version>
//   target <device> (shots=<n>)
//
//   <Op>(<p1>, <p2>) | [<m1>, <m2>]
//
// Only the header is interpreted; body lines are carried verbatim.

struct BlackbirdTarget {
    std::string name;
    std::vector<std::pair<std::string, std::string>> options;  // in source order
};

class BlackbirdScript {
public:
    BlackbirdScript() = default;

    /// Parse script text. Fails with InvalidProgram when name or version is
    /// missing or the target line is malformed.
    [[nodiscard]] static ApiResult<BlackbirdScript> parse(std::string_view text);

    [[nodiscard]] static BlackbirdScript from_program(const Program& program);

    /// Replace the target with `target` and options {shots: shots}.
    BlackbirdScript& with_target(const std::string& target, int shots);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& version() const noexcept { return version_; }
    [[nodiscard]] const std::optional<BlackbirdTarget>& target() const noexcept { return target_; }
    [[nodiscard]] const std::vector<std::string>& body() const noexcept { return body_; }

    /// "shots" target option, if present and numeric
    [[nodiscard]] std::optional<int> shots() const;

    [[nodiscard]] std::string serialize() const;

private:
    std::string name_;
    std::string version_;
    std::optional<BlackbirdTarget> target_;
    std::vector<std::string> body_;
};

/// Serialize `program` for submission to `target` with `shots` repetitions.
[[nodiscard]] std::string to_blackbird(const Program& program, const std::string& target, int shots);

}  // namespace starship
