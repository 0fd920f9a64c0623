#include <CLI/CLI.hpp>
#include <lifsim/v1/core.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lifsim::v1;

namespace {

// Sentinel value to detect if a CLI option was explicitly provided
constexpr double CLI_SENTINEL = -1e99;

struct NeuronOverrides {
    double tau_m = CLI_SENTINEL;
    double v_rest = CLI_SENTINEL;
    double v_reset = CLI_SENTINEL;
    double v_th = CLI_SENTINEL;
    double resistance = CLI_SENTINEL;
    double v_min = CLI_SENTINEL;
    double v_max = CLI_SENTINEL;

    void apply(LIFParameters& neuron, DivergenceBounds& bounds) const {
        if (tau_m != CLI_SENTINEL) neuron.tau_m = tau_m;
        if (v_rest != CLI_SENTINEL) neuron.v_rest = v_rest;
        if (v_reset != CLI_SENTINEL) neuron.v_reset = v_reset;
        if (v_th != CLI_SENTINEL) neuron.v_th = v_th;
        if (resistance != CLI_SENTINEL) neuron.R = resistance;
        if (v_min != CLI_SENTINEL) bounds.v_min = v_min;
        if (v_max != CLI_SENTINEL) bounds.v_max = v_max;
    }
};

std::optional<parser::ExperimentConfig> load_config(const std::string& config_file, bool quiet) {
    if (config_file.empty()) {
        return parser::ExperimentConfig{};
    }

    if (!quiet) {
        std::cerr << "Reading config: " << config_file << std::endl;
    }

    parser::YamlParser yaml;
    parser::ExperimentConfig config = yaml.load(config_file);
    if (!quiet) {
        for (const auto& warning : yaml.warnings()) {
            std::cerr << "Warning: " << warning << std::endl;
        }
    }
    if (!yaml.errors().empty()) {
        for (const auto& error : yaml.errors()) {
            std::cerr << "Error: " << error << std::endl;
        }
        return std::nullopt;
    }
    return config;
}

void write_trace_csv(const SimulationResult& result, std::ostream& out) {
    out << "time,voltage,spike\n";
    out << std::scientific << std::setprecision(9);
    for (Index i = 0; i < result.time.size(); ++i) {
        out << result.time[i] << "," << result.voltage[i] << ","
            << static_cast<int>(result.spikes[i]) << "\n";
    }
}

void write_sweep_csv(const DtSweepReport& report, std::ostream& out) {
    out << "integrator,dt,spike_count,spike_count_error,first_spike_error,max_voltage_error,diverged\n";
    out << std::scientific << std::setprecision(9);
    for (const auto& row : report.rows) {
        out << to_string(row.method) << "," << row.dt << ",";
        if (row.diverged) {
            out << ",,,," << "1\n";
            continue;
        }
        out << row.spike_count << "," << row.spike_count_error << ",";
        if (row.first_spike_error) {
            out << *row.first_spike_error;
        }
        out << "," << row.max_voltage_error << ",0\n";
    }
}

nlohmann::json sweep_to_json(const DtSweepReport& report) {
    nlohmann::json j;
    j["reference_dt"] = report.reference_dt;
    j["reference_spike_count"] = report.reference_spike_count;
    j["reference_first_spike"] = report.reference_first_spike
        ? nlohmann::json(*report.reference_first_spike)
        : nlohmann::json(nullptr);

    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : report.rows) {
        nlohmann::json r;
        r["integrator"] = to_string(row.method);
        r["dt"] = row.dt;
        r["diverged"] = row.diverged;
        if (row.diverged) {
            r["message"] = row.message;
        } else {
            r["spike_count"] = row.spike_count;
            r["spike_count_error"] = row.spike_count_error;
            r["first_spike_error"] = row.first_spike_error
                ? nlohmann::json(*row.first_spike_error)
                : nlohmann::json(nullptr);
            r["max_voltage_error"] = row.max_voltage_error;
        }
        rows.push_back(std::move(r));
    }
    j["rows"] = std::move(rows);
    return j;
}

template<typename Writer>
void write_output(const std::string& output_file, Writer&& writer) {
    if (output_file.empty()) {
        writer(std::cout);
        return;
    }
    std::ofstream file(output_file);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + output_file);
    }
    writer(file);
}

void print_progress(Real time, Real tstop) {
    int percent = static_cast<int>(100.0 * time / tstop);
    std::cerr << "\rProgress: " << percent << "% (t=" << std::scientific
              << std::setprecision(3) << time << "s)" << std::flush;
}

int cmd_run(const std::string& config_file, const std::string& output_file,
            const std::string& cli_integrator, double cli_dt, double cli_duration,
            double cli_current, const NeuronOverrides& overrides,
            bool verbose, bool quiet) {
    try {
        auto loaded = load_config(config_file, quiet);
        if (!loaded) {
            return 1;
        }
        parser::ExperimentConfig& config = *loaded;

        // Apply CLI overrides only if explicitly provided (not sentinel values)
        if (!cli_integrator.empty()) {
            const auto method = parse_integrator(cli_integrator);
            if (!method) {
                std::cerr << "Error: unknown integrator '" << cli_integrator << "'" << std::endl;
                return 1;
            }
            config.integrator = *method;
        }
        if (cli_dt != CLI_SENTINEL) config.simulation.dt = cli_dt;
        if (cli_duration != CLI_SENTINEL) config.duration = cli_duration;
        if (cli_current != CLI_SENTINEL) {
            config.current = cli_current;
            config.current_samples.clear();
        }
        overrides.apply(config.simulation.neuron, config.simulation.bounds);

        if (config.current_samples.empty() && config.simulation.dt > 0.0 && config.duration > 0.0 &&
            !sample_count(config.duration, config.simulation.dt)) {
            std::cerr << "Error: duration " << config.duration << "s at dt " << config.simulation.dt
                      << "s gives too many steps" << std::endl;
            return 1;
        }

        const Vector input = config.input_current();
        const LIFParameters& p = config.simulation.neuron;

        if (!quiet) {
            std::cerr << "Running LIF simulation..." << std::endl;
            std::cerr << "  integrator: " << to_string(config.integrator) << std::endl;
            std::cerr << "  dt: " << config.simulation.dt << "s" << std::endl;
            std::cerr << "  steps: " << input.size() << std::endl;
        }
        if (verbose) {
            std::cerr << "  tau_m: " << p.tau_m << "s" << std::endl;
            std::cerr << "  v_rest: " << p.v_rest << ", v_reset: " << p.v_reset
                      << ", v_th: " << p.v_th << ", R: " << p.R << std::endl;
            if (requires_divergence_check(config.integrator)) {
                std::cerr << "  bounds: [" << config.simulation.bounds.v_min << ", "
                          << config.simulation.bounds.v_max << "]" << std::endl;
            }
        }

        const Real tstop = static_cast<Real>(input.size()) * config.simulation.dt;
        const Index report_every = std::max<Index>(1, input.size() / 20);
        Index step_counter = 0;
        StepCallback progress;
        if (verbose) {
            progress = [&](Real time, Real, bool) {
                if (++step_counter % report_every == 0) {
                    print_progress(time, tstop);
                }
            };
        }

        const SimulationResult result = simulate(config.integrator, input, config.simulation, progress);
        if (verbose) {
            std::cerr << std::endl;  // Newline after progress
        }

        if (!result.success) {
            std::cerr << "Simulation failed: " << result.message << std::endl;
            if (is_divergence(result.diagnostic)) {
                std::cerr << "  failed step: " << result.failed_step
                          << ", v=" << result.failed_value << std::endl;
            }
            return 1;
        }

        if (!quiet) {
            std::cerr << "Simulation completed:" << std::endl;
            std::cerr << "  Total steps: " << result.total_steps << std::endl;
            std::cerr << "  Spikes: " << result.spike_count << std::endl;
            if (const auto first = first_spike_time(result)) {
                std::cerr << "  First spike: " << *first << "s" << std::endl;
            }
            std::cerr << "  Wall time: " << std::fixed << std::setprecision(6)
                      << result.total_time_seconds << "s" << std::endl;
        }

        if (!quiet && !output_file.empty()) {
            std::cerr << "Writing trace to: " << output_file << std::endl;
        }
        write_output(output_file, [&](std::ostream& out) { write_trace_csv(result, out); });

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_compare(const std::string& config_file, const std::string& output_file,
                const std::vector<double>& cli_dt_values, double cli_duration,
                double cli_current, double cli_reference_dt, const std::string& format,
                const NeuronOverrides& overrides, bool verbose, bool quiet) {
    try {
        auto loaded = load_config(config_file, quiet);
        if (!loaded) {
            return 1;
        }
        DtSweepOptions sweep = loaded->sweep;

        if (!cli_dt_values.empty()) sweep.dt_values = cli_dt_values;
        if (cli_duration != CLI_SENTINEL) sweep.duration = cli_duration;
        if (cli_current != CLI_SENTINEL) sweep.current = cli_current;
        if (cli_reference_dt != CLI_SENTINEL) sweep.reference_dt = cli_reference_dt;
        overrides.apply(sweep.neuron, sweep.bounds);

        if (!quiet) {
            std::cerr << "Running dt sweep over " << sweep.dt_values.size()
                      << " step sizes (duration " << sweep.duration
                      << "s, current " << sweep.current << ")..." << std::endl;
        }

        const auto start = std::chrono::steady_clock::now();
        const DtSweepReport report = compare_dt_errors(sweep);
        const double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        if (!report.success) {
            std::cerr << "Comparison failed: " << report.message << std::endl;
            return 1;
        }

        if (!quiet) {
            std::cerr << "Reference: exact, dt=" << report.reference_dt
                      << ", spikes=" << report.reference_spike_count << std::endl;
            for (const auto& row : report.rows) {
                if (row.diverged) {
                    std::cerr << "  " << to_string(row.method) << " dt=" << row.dt
                              << " diverged: " << row.message << std::endl;
                } else if (verbose) {
                    std::cerr << "  " << to_string(row.method) << " dt=" << row.dt
                              << " spike_count_error=" << row.spike_count_error
                              << " max_voltage_error=" << row.max_voltage_error << std::endl;
                }
            }
            std::cerr << "  Wall time: " << std::fixed << std::setprecision(3) << wall << "s" << std::endl;
        }

        write_output(output_file, [&](std::ostream& out) {
            if (format == "json") {
                out << sweep_to_json(report).dump(2) << "\n";
            } else {
                write_sweep_csv(report, out);
            }
        });

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_validate(const std::string& config_file, bool verbose) {
    try {
        parser::YamlParser yaml;
        const parser::ExperimentConfig config = yaml.load(config_file);

        for (const auto& warning : yaml.warnings()) {
            std::cerr << "Warning: " << warning << std::endl;
        }
        if (!yaml.errors().empty()) {
            for (const auto& error : yaml.errors()) {
                std::cerr << "Validation failed: " << error << std::endl;
            }
            return 2;
        }

        if (verbose) {
            const LIFParameters& p = config.simulation.neuron;
            std::cout << "Config is valid." << std::endl;
            std::cout << "  Integrator: " << to_string(config.integrator) << std::endl;
            std::cout << "  dt: " << config.simulation.dt << "s" << std::endl;
            std::cout << "  Steps: " << config.input_current().size() << std::endl;
            std::cout << "  Neuron: tau_m=" << p.tau_m << " v_rest=" << p.v_rest
                      << " v_reset=" << p.v_reset << " v_th=" << p.v_th << " R=" << p.R << std::endl;

            const LIFAnalytical analytical{p, config.current, p.v_rest};
            if (const auto t_first = analytical.first_spike_time()) {
                std::cout << "  Analytical first spike: " << *t_first << "s, rate "
                          << analytical.firing_rate() << "Hz" << std::endl;
            } else {
                std::cout << "  Analytical response is subthreshold (v_inf="
                          << analytical.steady_state() << ")" << std::endl;
            }
            std::cout << "  Sweep dt values: " << config.sweep.dt_values.size() << std::endl;
        } else {
            std::cout << "OK" << std::endl;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

void add_neuron_options(CLI::App* cmd, NeuronOverrides& overrides) {
    cmd->add_option("--tau-m", overrides.tau_m, "Membrane time constant in s (overrides config)");
    cmd->add_option("--v-rest", overrides.v_rest, "Resting potential (overrides config)");
    cmd->add_option("--v-reset", overrides.v_reset, "Reset potential (overrides config)");
    cmd->add_option("--v-th", overrides.v_th, "Spike threshold (overrides config)");
    cmd->add_option("--resistance", overrides.resistance, "Membrane resistance (overrides config)");
    cmd->add_option("--v-min", overrides.v_min, "Lower divergence bound, forward Euler (overrides config)");
    cmd->add_option("--v-max", overrides.v_max, "Upper divergence bound, forward Euler (overrides config)");
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"LifSim - leaky integrate-and-fire integrator comparison"};
    app.set_version_flag("-V,--version", "LifSim 0.1.0");

    // Global options
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");

    // Run command
    auto* run_cmd = app.add_subcommand("run", "Simulate one neuron with one integrator");
    std::string run_config;
    std::string run_output;
    std::string run_integrator;
    double run_dt = CLI_SENTINEL;
    double run_duration = CLI_SENTINEL;
    double run_current = CLI_SENTINEL;
    NeuronOverrides run_overrides;

    run_cmd->add_option("config", run_config, "Experiment file (YAML)")
        ->check(CLI::ExistingFile);
    run_cmd->add_option("-o,--output", run_output, "Output file (CSV)");
    run_cmd->add_option("-i,--integrator", run_integrator, "forward | backward | exact (overrides config)");
    run_cmd->add_option("--dt", run_dt, "Time step in s (overrides config)");
    run_cmd->add_option("--duration", run_duration, "Simulated time in s (overrides config)");
    run_cmd->add_option("--current", run_current, "Constant input current (overrides config)");
    add_neuron_options(run_cmd, run_overrides);

    run_cmd->callback([&]() {
        std::exit(cmd_run(run_config, run_output, run_integrator, run_dt, run_duration,
                          run_current, run_overrides, verbose, quiet));
    });

    // Compare command
    auto* compare_cmd = app.add_subcommand("compare", "Sweep dt and compare integrators to an exact reference");
    std::string compare_config;
    std::string compare_output;
    std::string compare_format = "csv";
    std::vector<double> compare_dt_values;
    double compare_duration = CLI_SENTINEL;
    double compare_current = CLI_SENTINEL;
    double compare_reference_dt = CLI_SENTINEL;
    NeuronOverrides compare_overrides;

    compare_cmd->add_option("config", compare_config, "Experiment file (YAML)")
        ->check(CLI::ExistingFile);
    compare_cmd->add_option("-o,--output", compare_output, "Output file");
    compare_cmd->add_option("--format", compare_format, "Output format")
        ->check(CLI::IsMember({"csv", "json"}));
    compare_cmd->add_option("--dt-values", compare_dt_values, "Step sizes in s (overrides config)");
    compare_cmd->add_option("--duration", compare_duration, "Simulated time in s (overrides config)");
    compare_cmd->add_option("--current", compare_current, "Constant input current (overrides config)");
    compare_cmd->add_option("--reference-dt", compare_reference_dt,
                            "Reference step in s (default min(dt)/10)");
    add_neuron_options(compare_cmd, compare_overrides);

    compare_cmd->callback([&]() {
        std::exit(cmd_compare(compare_config, compare_output, compare_dt_values, compare_duration,
                              compare_current, compare_reference_dt, compare_format,
                              compare_overrides, verbose, quiet));
    });

    // Validate command
    auto* validate_cmd = app.add_subcommand("validate", "Validate experiment file");
    std::string validate_file;
    validate_cmd->add_option("config", validate_file, "Experiment file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    validate_cmd->callback([&]() {
        std::exit(cmd_validate(validate_file, verbose));
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
