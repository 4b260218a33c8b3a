// Example 02: Remote Engine
//
// Let RemoteEngine submit and wait, with a timeout.

#include <starship/engine/remote_engine.hpp>

#include <iostream>

using namespace starship;

int main() {
    std::cout << "=== Remote Engine Example ===\n\n";

    ConnectionConfig config = config_from_env();
    if (!config.is_valid()) {
        std::cerr << config.validation_error() << "\n";
        return 1;
    }
    Connection connection(config);

    Program program(4);
    for (int mode = 0; mode < 4; ++mode) {
        program.apply("S2gate", {1.0, 0.0}, {mode, (mode + 1) % 4});
    }
    program.apply("MeasureFock", {}, {0, 1, 2, 3});

    RemoteEngine engine(connection, "chip2",
                        EngineOptions{}
                            .with_shots(20)
                            .with_poll_interval(std::chrono::milliseconds{500})
                            .with_timeout(std::chrono::minutes{5}));

    auto result = engine.run(program);
    if (!result) {
        std::cerr << to_string(result.error().code) << ": " << result.error().message << "\n";
        return 1;
    }

    const auto& samples = result->samples();
    std::cout << "Received " << samples.rows() << " shots\n";
    for (std::size_t shot = 0; shot < samples.rows(); ++shot) {
        std::cout << "  shot " << shot << ":";
        for (const double photons : samples.row(shot)) {
            std::cout << " " << photons;
        }
        std::cout << "\n";
    }
    return 0;
}
