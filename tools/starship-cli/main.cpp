// ─────────────────────────────────────────────────────────────────────────────
// starship-cli - run Blackbird scripts on the remote platform
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   # Check that the token and address are accepted
//   starship-cli --ping
//
//   # Run a script and print the samples
//   starship-cli --input program.xbb
//   starship-cli -i program.xbb -o samples.txt --shots 100
//
// Connection settings come from SF_API_AUTHENTICATION_TOKEN, SF_API_HOSTNAME,
// SF_API_PORT and SF_API_USE_SSL; the --token/--host/--port/--no-ssl flags
// override them.

#include <cxxopts.hpp>

#include "starship/api/connection.hpp"
#include "starship/circuit/blackbird.hpp"
#include "starship/engine/remote_engine.hpp"
#include "starship/log/spdlog_logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using namespace starship;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset = "\033[0m";
    const char* red   = "\033[31m";
    const char* green = "\033[32m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << msg << color::c(color::reset) << "\n";
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_ping(const Connection& connection) {
    if (!connection.ping()) {
        print_error("Could not reach the platform at " + connection.base_url());
        return 1;
    }
    print_success("You have successfully authenticated to the platform!");
    return 0;
}

int cmd_run(const Connection& connection, const cxxopts::ParseResult& args) {
    const auto input = args["input"].as<std::string>();
    const auto text = read_file(input);
    if (!text) {
        print_error("Cannot read " + input);
        return 1;
    }

    auto script = BlackbirdScript::parse(*text);
    if (!script) {
        print_error(input + ": " + script.error().message);
        return 1;
    }

    std::string target;
    if (args.count("target")) {
        target = args["target"].as<std::string>();
    } else if (script->target()) {
        target = script->target()->name;
    } else {
        print_error(input + " names no target device; pass --target");
        return 1;
    }

    EngineOptions options;
    options.shots = args.count("shots") ? args["shots"].as<int>() : script->shots().value_or(1);
    options.poll_interval = std::chrono::milliseconds{args["poll-interval"].as<int>()};
    options.timeout = std::chrono::milliseconds{args["timeout"].as<int>()};

    std::unique_ptr<RemoteEngine> engine;
    try {
        engine = std::make_unique<RemoteEngine>(connection, target, options);
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }

    std::cout << "Executing program on remote hardware...\n";
    auto result = engine->run(*script);
    if (!result) {
        print_error(std::string(to_string(result.error().code)) + ": " + result.error().message);
        return 1;
    }

    const std::string samples = result->samples().to_string();
    if (args.count("output")) {
        const auto output = args["output"].as<std::string>();
        std::ofstream file(output);
        if (!file) {
            print_error("Cannot write " + output);
            return 1;
        }
        file << samples;
    } else {
        std::cout << samples << "\n";
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("starship-cli", "Run Blackbird scripts on the remote platform");

    options.add_options()
        // Commands (exactly one)
        ("i,input", "Blackbird script to run", cxxopts::value<std::string>())
        ("p,ping", "Test the API connection")

        // Run options
        ("o,output", "Write samples to this file instead of stdout", cxxopts::value<std::string>())
        ("target", "Target device (overrides the script's target)", cxxopts::value<std::string>())
        ("shots", "Number of shots (overrides the script's target options)", cxxopts::value<int>())
        ("poll-interval", "Milliseconds between status requests (at least 1)", cxxopts::value<int>()->default_value("1000"))
        ("timeout", "Give up after this many milliseconds (0 = wait forever)", cxxopts::value<int>()->default_value("0"))

        // Connection overrides
        ("token", "API authentication token", cxxopts::value<std::string>())
        ("host", "Platform hostname", cxxopts::value<std::string>())
        ("port", "Platform port", cxxopts::value<int>())
        ("no-ssl", "Connect over plain HTTP")

        // Output
        ("no-color", "Disable colored output")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print usage");

    try {
        auto args = options.parse(argc, argv);

        if (args.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !args.count("no-color");

        const bool run_input = args.count("input") > 0;
        const bool run_ping = args.count("ping") > 0;
        if (run_input == run_ping) {
            print_error("Specify exactly one of --input or --ping");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        const bool verbose = args.count("verbose") > 0;
        set_logger(make_spdlog_console_logger(verbose ? LogLevel::Debug : LogLevel::Info));

        ConnectionConfig config = config_from_env();
        if (args.count("token")) config.token = args["token"].as<std::string>();
        if (args.count("host")) config.host = args["host"].as<std::string>();
        if (args.count("port")) {
            const int port = args["port"].as<int>();
            if (port < 1 || port > 65535) {
                print_error("--port must be between 1 and 65535");
                return 1;
            }
            config.port = static_cast<std::uint16_t>(port);
        }
        if (args.count("no-ssl")) config.use_ssl = false;
        config.verbose = config.verbose || verbose;

        if (!config.is_valid()) {
            print_error(config.validation_error()
                        + " (set SF_API_AUTHENTICATION_TOKEN or pass --token)");
            return 1;
        }

        std::unique_ptr<Connection> connection;
        try {
            connection = std::make_unique<Connection>(config);
        } catch (const std::invalid_argument& e) {
            print_error(e.what());
            return 1;
        }

        if (run_ping) {
            return cmd_ping(*connection);
        }
        return cmd_run(*connection, args);

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
