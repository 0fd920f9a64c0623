#pragma once

#include "lifsim/v1/integration.hpp"
#include "lifsim/v1/simulation.hpp"
#include "lifsim/v1/validation.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace lifsim::v1::parser {

struct YamlParserOptions {
    bool strict = true;  // Fail on unknown fields
};

/// Everything an experiment file can describe: one simulation and one dt sweep
struct ExperimentConfig {
    Integrator integrator = Integrator::Exact;
    SimulationOptions simulation{};
    Real duration = 1.0;
    Real current = 1.5;
    std::vector<Real> current_samples;  // Explicit per-step input, wins over current/duration

    DtSweepOptions sweep{};

    /// Input sequence for the single-simulation section
    [[nodiscard]] Vector input_current() const;
};

class YamlParser {
public:
    explicit YamlParser(YamlParserOptions options = {});

    // Parse from file
    ExperimentConfig load(const std::filesystem::path& path);

    // Parse from string
    ExperimentConfig load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    YamlParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, ExperimentConfig& config);
};

}  // namespace lifsim::v1::parser
