#include "lifsim/v1/parser/yaml_parser.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace lifsim::v1::parser {

namespace {

constexpr const char* kSchemaId = "lifsim-v1";
constexpr const char* kDiagUnknownField = "LIFSIM_YAML_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "LIFSIM_YAML_E_TYPE_MISMATCH";
constexpr const char* kDiagInvalidParameter = "LIFSIM_YAML_E_PARAM_INVALID";
constexpr const char* kDiagInvalidIntegrator = "LIFSIM_YAML_E_INTEGRATOR_INVALID";
constexpr const char* kDiagCurrentOverridden = "LIFSIM_YAML_W_CURRENT_OVERRIDDEN";
constexpr const char* kDiagThresholdBelowReset = "LIFSIM_YAML_W_THRESHOLD_BELOW_RESET";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

void push_type_mismatch_error(std::vector<std::string>& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    push_error(
        errors,
        kDiagTypeMismatch,
        "Type mismatch at '" + path + "' (expected " + expected +
            ", got " + yaml_node_class(received) + ")");
}

std::optional<int> parse_int_scalar(const YAML::Node& node,
                                    const std::string& path,
                                    std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
    try {
        return node.as<int>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
}

std::optional<std::string> parse_string_scalar(const YAML::Node& node,
                                               const std::string& path,
                                               std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "string", node);
        return std::nullopt;
    }
    return node.Scalar();
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   std::vector<std::string>& errors,
                   bool strict) {
    if (!strict || !node || !node.IsMap()) return;
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        if (allowed.find(key) == allowed.end()) {
            push_error(errors,
                       kDiagUnknownField,
                       "Unknown field at '" + context + "." + key + "'");
        }
    }
}

// Accepts plain numbers and SI-suffixed values such as "20m", "10u" or "1k"
Real parse_real_string(const std::string& raw) {
    char* end = nullptr;
    const double base = std::strtod(raw.c_str(), &end);
    if (raw.empty() || end == raw.c_str()) {
        throw std::invalid_argument("invalid numeric value");
    }

    std::string suffix = raw.substr(static_cast<std::size_t>(end - raw.c_str()));
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!suffix.empty() && is_space(static_cast<unsigned char>(suffix.front()))) {
        suffix.erase(suffix.begin());
    }
    while (!suffix.empty() && is_space(static_cast<unsigned char>(suffix.back()))) {
        suffix.pop_back();
    }
    if (suffix.empty()) return base;

    const std::string lower = to_lower(suffix);
    auto starts_with = [&](const std::string& prefix) {
        return lower.rfind(prefix, 0) == 0;
    };

    double multiplier = 1.0;
    if (starts_with("meg") || suffix.front() == 'M') {
        multiplier = 1e6;
    } else if (starts_with("k")) {
        multiplier = 1e3;
    } else if (starts_with("m")) {
        multiplier = 1e-3;
    } else if (starts_with("u")) {
        multiplier = 1e-6;
    } else if (starts_with("n")) {
        multiplier = 1e-9;
    } else if (starts_with("p")) {
        multiplier = 1e-12;
    } else if (starts_with("s")) {
        multiplier = 1.0;
    } else {
        throw std::invalid_argument("unknown unit suffix '" + suffix + "'");
    }

    return base * multiplier;
}

std::optional<Real> parse_real(const YAML::Node& node,
                               const std::string& path,
                               std::vector<std::string>& errors) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }
    try {
        return parse_real_string(node.Scalar());
    } catch (const std::invalid_argument&) {
        push_type_mismatch_error(errors, path, "number", node);
    }
    return std::nullopt;
}

std::optional<std::vector<Real>> parse_real_list(const YAML::Node& node,
                                                 const std::string& path,
                                                 std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsSequence()) {
        push_type_mismatch_error(errors, path, "sequence", node);
        return std::nullopt;
    }
    std::vector<Real> values;
    values.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
        const auto value = parse_real(node[i], path + "[" + std::to_string(i) + "]", errors);
        if (!value) {
            return std::nullopt;
        }
        values.push_back(*value);
    }
    return values;
}

void assign_real(const YAML::Node& map,
                 const std::string& key,
                 const std::string& context,
                 Real& target,
                 std::vector<std::string>& errors) {
    if (const auto value = parse_real(map[key], context + "." + key, errors)) {
        target = *value;
    }
}

void require_positive(Real value, const std::string& path, std::vector<std::string>& errors) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream message;
        message << "Parameter '" << path << "' must be finite and > 0 (got " << value << ")";
        push_error(errors, kDiagInvalidParameter, message.str());
    }
}

void require_finite(Real value, const std::string& path, std::vector<std::string>& errors) {
    if (!std::isfinite(value)) {
        std::ostringstream message;
        message << "Parameter '" << path << "' must be finite (got " << value << ")";
        push_error(errors, kDiagInvalidParameter, message.str());
    }
}

void require_sample_count(Real duration, Real dt, const std::string& path, std::vector<std::string>& errors) {
    if (std::isfinite(duration) && std::isfinite(dt) && duration > 0.0 && dt > 0.0 &&
        !sample_count(duration, dt)) {
        std::ostringstream message;
        message << "Parameter '" << path << "' gives too many steps (duration " << duration
                << " / dt " << dt << ")";
        push_error(errors, kDiagInvalidParameter, message.str());
    }
}

}  // namespace

Vector ExperimentConfig::input_current() const {
    if (!current_samples.empty()) {
        return Eigen::Map<const Vector>(current_samples.data(),
                                        static_cast<Index>(current_samples.size()));
    }
    return constant_current(duration, simulation.dt, current);
}

YamlParser::YamlParser(YamlParserOptions options)
    : options_(options) {}

ExperimentConfig YamlParser::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.clear();
        warnings_.clear();
        errors_.push_back("Cannot open file: " + path.string());
        return ExperimentConfig{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

ExperimentConfig YamlParser::load_string(const std::string& content) {
    ExperimentConfig config;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, config);
    return config;
}

void YamlParser::parse_yaml(const std::string& content, ExperimentConfig& config) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        errors_.push_back(std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root.IsMap()) {
        push_type_mismatch_error(errors_, "root", "map", root);
        return;
    }

    validate_keys(root, {"schema", "version", "neuron", "simulation", "sweep"},
                  "root", errors_, options_.strict);

    if (!root["schema"]) {
        errors_.push_back("Missing required field 'schema'");
        return;
    }
    if (!root["version"]) {
        errors_.push_back("Missing required field 'version'");
        return;
    }

    const std::optional<std::string> schema = parse_string_scalar(root["schema"], "root.schema", errors_);
    if (!schema) {
        return;
    }
    if (*schema != kSchemaId) {
        errors_.push_back("Unsupported schema: " + *schema);
        return;
    }

    const std::optional<int> version = parse_int_scalar(root["version"], "root.version", errors_);
    if (!version) {
        return;
    }
    if (*version != 1) {
        errors_.push_back("Unsupported schema version: " + std::to_string(*version));
        return;
    }

    // Neuron parameters
    LIFParameters& neuron = config.simulation.neuron;
    if (const YAML::Node node = root["neuron"]) {
        if (!node.IsMap()) {
            push_type_mismatch_error(errors_, "neuron", "map", node);
        } else {
            validate_keys(node, {"tau_m", "v_rest", "v_reset", "v_th", "R", "resistance"},
                          "neuron", errors_, options_.strict);
            assign_real(node, "tau_m", "neuron", neuron.tau_m, errors_);
            assign_real(node, "v_rest", "neuron", neuron.v_rest, errors_);
            assign_real(node, "v_reset", "neuron", neuron.v_reset, errors_);
            assign_real(node, "v_th", "neuron", neuron.v_th, errors_);
            assign_real(node, "resistance", "neuron", neuron.R, errors_);
            assign_real(node, "R", "neuron", neuron.R, errors_);
        }
    }

    // Single simulation
    bool sweep_duration_set = false;
    bool sweep_current_set = false;
    if (const YAML::Node sim = root["simulation"]) {
        if (!sim.IsMap()) {
            push_type_mismatch_error(errors_, "simulation", "map", sim);
        } else {
            validate_keys(sim, {"integrator", "dt", "duration", "current", "current_samples", "bounds"},
                          "simulation", errors_, options_.strict);

            if (const auto name = parse_string_scalar(sim["integrator"], "simulation.integrator", errors_)) {
                if (const auto method = parse_integrator(*name)) {
                    config.integrator = *method;
                } else {
                    push_error(errors_, kDiagInvalidIntegrator,
                               "Unknown integrator '" + *name +
                                   "' at 'simulation.integrator' (expected forward, backward or exact)");
                }
            }

            assign_real(sim, "dt", "simulation", config.simulation.dt, errors_);
            assign_real(sim, "duration", "simulation", config.duration, errors_);
            assign_real(sim, "current", "simulation", config.current, errors_);

            if (auto samples = parse_real_list(sim["current_samples"], "simulation.current_samples", errors_)) {
                config.current_samples = std::move(*samples);
                if (sim["current"] || sim["duration"]) {
                    push_warning(warnings_, kDiagCurrentOverridden,
                                 "'simulation.current_samples' overrides 'simulation.current' and "
                                 "'simulation.duration'");
                }
            }

            if (const YAML::Node bounds = sim["bounds"]) {
                if (!bounds.IsMap()) {
                    push_type_mismatch_error(errors_, "simulation.bounds", "map", bounds);
                } else {
                    validate_keys(bounds, {"v_min", "v_max"}, "simulation.bounds", errors_, options_.strict);
                    assign_real(bounds, "v_min", "simulation.bounds", config.simulation.bounds.v_min, errors_);
                    assign_real(bounds, "v_max", "simulation.bounds", config.simulation.bounds.v_max, errors_);
                }
            }
        }
    }

    // dt sweep
    DtSweepOptions& sweep = config.sweep;
    if (const YAML::Node node = root["sweep"]) {
        if (!node.IsMap()) {
            push_type_mismatch_error(errors_, "sweep", "map", node);
        } else {
            validate_keys(node, {"dt_values", "duration", "current", "reference_dt"},
                          "sweep", errors_, options_.strict);
            if (auto dts = parse_real_list(node["dt_values"], "sweep.dt_values", errors_)) {
                sweep.dt_values = std::move(*dts);
            }
            if (const auto value = parse_real(node["duration"], "sweep.duration", errors_)) {
                sweep.duration = *value;
                sweep_duration_set = true;
            }
            if (const auto value = parse_real(node["current"], "sweep.current", errors_)) {
                sweep.current = *value;
                sweep_current_set = true;
            }
            if (const auto value = parse_real(node["reference_dt"], "sweep.reference_dt", errors_)) {
                sweep.reference_dt = *value;
                require_positive(sweep.reference_dt, "sweep.reference_dt", errors_);
            }
        }
    }

    // The sweep shares the neuron and bounds, and inherits the stimulus unless overridden
    sweep.neuron = neuron;
    sweep.bounds = config.simulation.bounds;
    if (!sweep_duration_set) {
        sweep.duration = config.duration;
    }
    if (!sweep_current_set) {
        sweep.current = config.current;
    }

    require_positive(neuron.tau_m, "neuron.tau_m", errors_);
    require_positive(neuron.R, "neuron.R", errors_);
    require_positive(config.simulation.dt, "simulation.dt", errors_);
    require_positive(config.duration, "simulation.duration", errors_);
    require_positive(sweep.duration, "sweep.duration", errors_);
    require_finite(neuron.v_rest, "neuron.v_rest", errors_);
    require_finite(neuron.v_reset, "neuron.v_reset", errors_);
    require_finite(neuron.v_th, "neuron.v_th", errors_);
    if (config.current_samples.empty()) {
        require_sample_count(config.duration, config.simulation.dt, "simulation.dt", errors_);
    }
    if (sweep.dt_values.empty()) {
        push_error(errors_, kDiagInvalidParameter, "Parameter 'sweep.dt_values' must not be empty");
    }
    for (std::size_t i = 0; i < sweep.dt_values.size(); ++i) {
        const std::string path = "sweep.dt_values[" + std::to_string(i) + "]";
        require_positive(sweep.dt_values[i], path, errors_);
        require_sample_count(sweep.duration, sweep.dt_values[i], path, errors_);
    }
    if (sweep.reference_dt > 0.0) {
        require_sample_count(sweep.duration, sweep.reference_dt, "sweep.reference_dt", errors_);
    }
    require_finite(config.simulation.bounds.v_min, "simulation.bounds.v_min", errors_);
    require_finite(config.simulation.bounds.v_max, "simulation.bounds.v_max", errors_);
    if (config.simulation.bounds.v_min > config.simulation.bounds.v_max) {
        push_error(errors_, kDiagInvalidParameter,
                   "Parameter 'simulation.bounds' requires v_min <= v_max");
    }
    if (neuron.v_th <= neuron.v_reset) {
        push_warning(warnings_, kDiagThresholdBelowReset,
                     "'neuron.v_th' is not above 'neuron.v_reset'; the neuron will fire on every step "
                     "once it reaches threshold");
    }
}

}  // namespace lifsim::v1::parser
