#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "starship/circuit/blackbird.hpp"

#include <stdexcept>

using namespace starship;
using Catch::Matchers::ContainsSubstring;

// ═══════════════════════════════════════════════════════════════════════════
// Program
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Program records operations in order", "[blackbird][program]") {
    Program program(2, "demo");
    program.apply("Sgate", {0.5}, {0})
           .apply("BSgate", {0.25, 0.0}, {0, 1})
           .apply("MeasureFock", {}, {0, 1});

    REQUIRE(program.name() == "demo");
    REQUIRE(program.version() == "1.0");
    REQUIRE(program.operations().size() == 3);
    REQUIRE(program.operations()[1].name == "BSgate");
    REQUIRE(program.operations()[1].modes == std::vector<int>{0, 1});
}

TEST_CASE("Program rejects invalid operations", "[blackbird][program]") {
    REQUIRE_THROWS_AS(Program(0), std::invalid_argument);

    Program program(2);
    REQUIRE_THROWS_AS(program.apply("", {}, {0}), std::invalid_argument);
    REQUIRE_THROWS_AS(program.apply("Sgate", {1.0}, {}), std::invalid_argument);
    REQUIRE_THROWS_AS(program.apply("Sgate", {1.0}, {2}), std::invalid_argument);
    REQUIRE_THROWS_AS(program.apply("Sgate", {1.0}, {-1}), std::invalid_argument);
    REQUIRE(program.operations().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Serialization
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("to_blackbird writes header, target and operations", "[blackbird]") {
    Program program(2, "demo");
    program.apply("Sgate", {0.5}, {0})
           .apply("BSgate", {0.25, 0.0}, {0, 1})
           .apply("MeasureFock", {}, {0, 1});

    REQUIRE(to_blackbird(program, "chip2", 123) ==
        "name demo\n"
        "version 1.0\n"
        "target chip2 (shots=123)\n"
        "\n"
        "Sgate(0.5) | 0\n"
        "BSgate(0.25, 0) | [0, 1]\n"
        "MeasureFock | [0, 1]\n");
}

TEST_CASE("BlackbirdScript::with_target replaces target options", "[blackbird]") {
    auto script = BlackbirdScript::parse(
        "name s\nversion 1.0\ntarget gaussian (shots=5, cutoff_dim=3)\nMeasureFock | 0\n");
    REQUIRE(script.has_value());

    script->with_target("chip2", 20);

    REQUIRE(script->target()->name == "chip2");
    REQUIRE(script->target()->options.size() == 1);
    REQUIRE(script->shots() == 20);
    REQUIRE_THAT(script->serialize(), ContainsSubstring("target chip2 (shots=20)\n"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlackbirdScript::parse reads the header", "[blackbird][parse]") {
    auto script = BlackbirdScript::parse(
        "# comment line\n"
        "name   my_program\n"
        "version 1.0\n"
        "target chip2 (shots = 10, mode=\"fast\")\n"
        "\n"
        "S2gate(1.0, 0.0) | [0, 4]   # squeeze\n"
        "MeasureFock() | [0, 4]\n");

    REQUIRE(script.has_value());
    REQUIRE(script->name() == "my_program");
    REQUIRE(script->version() == "1.0");
    REQUIRE(script->target().has_value());
    REQUIRE(script->target()->name == "chip2");
    REQUIRE(script->target()->options.size() == 2);
    REQUIRE(script->target()->options[0] == std::pair<std::string, std::string>{"shots", "10"});
    REQUIRE(script->shots() == 10);
    REQUIRE(script->body().size() == 2);
    REQUIRE(script->body()[0] == "S2gate(1.0, 0.0) | [0, 4]   # squeeze");
}

TEST_CASE("BlackbirdScript::parse without target", "[blackbird][parse]") {
    auto script = BlackbirdScript::parse("name a\nversion 1.0\nVgate(0.1) | 0\n");
    REQUIRE(script.has_value());
    REQUIRE_FALSE(script->target().has_value());
    REQUIRE_FALSE(script->shots().has_value());
    REQUIRE(script->serialize() == "name a\nversion 1.0\n\nVgate(0.1) | 0\n");
}

TEST_CASE("BlackbirdScript::parse reports invalid scripts", "[blackbird][parse]") {
    SECTION("missing name") {
        auto script = BlackbirdScript::parse("version 1.0\nMeasureFock | 0\n");
        REQUIRE_FALSE(script.has_value());
        REQUIRE(script.error().code == ApiErrorCode::InvalidProgram);
        REQUIRE_THAT(script.error().message, ContainsSubstring("name"));
    }

    SECTION("missing version") {
        auto script = BlackbirdScript::parse("name a\nMeasureFock | 0\n");
        REQUIRE_FALSE(script.has_value());
        REQUIRE(script.error().code == ApiErrorCode::InvalidProgram);
    }

    SECTION("unterminated target options") {
        auto script = BlackbirdScript::parse("name a\nversion 1.0\ntarget chip2 (shots=1\n");
        REQUIRE_FALSE(script.has_value());
        REQUIRE(script.error().code == ApiErrorCode::InvalidProgram);
    }

    SECTION("target option without value") {
        auto script = BlackbirdScript::parse("name a\nversion 1.0\ntarget chip2 (shots)\n");
        REQUIRE_FALSE(script.has_value());
        REQUIRE_THAT(script.error().message, ContainsSubstring("key=value"));
    }
}

TEST_CASE("BlackbirdScript::shots ignores non-numeric values", "[blackbird][parse]") {
    auto script = BlackbirdScript::parse("name a\nversion 1.0\ntarget chip2 (shots=many)\n");
    REQUIRE(script.has_value());
    REQUIRE_FALSE(script->shots().has_value());
}
