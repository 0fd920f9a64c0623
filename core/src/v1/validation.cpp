#include "lifsim/v1/validation.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lifsim::v1 {

namespace {

constexpr Real kStepCountTolerance = 1e-9;
// 2^63 as a double; integral values below it fit in Index
constexpr Real kMaxSampleCount = static_cast<Real>(std::numeric_limits<Index>::max());
constexpr std::array<Integrator, 3> kSweepOrder = {
    Integrator::ForwardEuler, Integrator::BackwardEuler, Integrator::Exact};

[[nodiscard]] std::optional<Real> time_to_threshold(const LIFParameters& p, Real current, Real v0) {
    if (v0 >= p.v_th) {
        return Real{0.0};
    }
    const Real v_inf = p.steady_state(current);
    if (v_inf <= p.v_th) {
        return std::nullopt;
    }
    return p.tau_m * std::log((v_inf - v0) / (v_inf - p.v_th));
}

DtSweepReport failed_report(std::string message) {
    DtSweepReport report;
    report.success = false;
    report.message = std::move(message);
    return report;
}

}  // namespace

// =============================================================================
// LIFAnalytical
// =============================================================================

Real LIFAnalytical::voltage(Real t) const {
    const Real v_inf = steady_state();
    return v_inf + (v0 - v_inf) * std::exp(-t / params.tau_m);
}

std::optional<Real> LIFAnalytical::first_spike_time() const {
    return time_to_threshold(params, current, v0);
}

std::optional<Real> LIFAnalytical::interspike_interval() const {
    if (params.v_reset >= params.v_th) {
        return std::nullopt;
    }
    return time_to_threshold(params, current, params.v_reset);
}

Real LIFAnalytical::firing_rate() const {
    const auto isi = interspike_interval();
    if (!isi || *isi <= 0.0) {
        return 0.0;
    }
    return 1.0 / *isi;
}

// =============================================================================
// Helpers
// =============================================================================

std::optional<Index> sample_count(Real duration, Real dt) {
    if (!std::isfinite(dt) || !std::isfinite(duration) || dt <= 0.0 || duration <= 0.0) {
        return std::nullopt;
    }
    const Real steps = std::floor(duration / dt * (1.0 + kStepCountTolerance));
    if (!std::isfinite(steps) || steps >= kMaxSampleCount) {
        return std::nullopt;
    }
    return static_cast<Index>(steps);
}

Vector constant_current(Real duration, Real dt, Real value) {
    const auto steps = sample_count(duration, dt);
    if (!steps) {
        return Vector();
    }
    return Vector::Constant(*steps, value);
}

std::vector<Real> spike_times(const SimulationResult& result) {
    std::vector<Real> times;
    times.reserve(static_cast<std::size_t>(result.spike_count));
    for (Index n = 0; n < result.spikes.size(); ++n) {
        if (result.spikes[n] > 0.5) {
            times.push_back(result.time[n]);
        }
    }
    return times;
}

std::optional<Real> first_spike_time(const SimulationResult& result) {
    for (Index n = 0; n < result.spikes.size(); ++n) {
        if (result.spikes[n] > 0.5) {
            return result.time[n];
        }
    }
    return std::nullopt;
}

Real max_voltage_error(const SimulationResult& a, const SimulationResult& b) {
    if (a.voltage.size() != b.voltage.size()) {
        std::ostringstream message;
        message << "Trace length mismatch: " << a.voltage.size() << " vs " << b.voltage.size();
        throw std::invalid_argument(message.str());
    }
    if (a.voltage.size() == 0) {
        return 0.0;
    }
    return (a.voltage - b.voltage).cwiseAbs().maxCoeff();
}

// =============================================================================
// dt Sweep
// =============================================================================

std::vector<IntegratorError> DtSweepReport::rows_for(Integrator method) const {
    std::vector<IntegratorError> out;
    std::copy_if(rows.begin(), rows.end(), std::back_inserter(out),
                 [method](const IntegratorError& row) { return row.method == method; });
    return out;
}

DtSweepReport compare_dt_errors(const DtSweepOptions& options) {
    if (options.dt_values.empty()) {
        return failed_report("dt sweep requires at least one dt value");
    }
    if (!std::isfinite(options.duration) || options.duration <= 0.0) {
        return failed_report("dt sweep requires a finite duration > 0");
    }
    for (const Real dt : options.dt_values) {
        if (!std::isfinite(dt) || dt <= 0.0) {
            std::ostringstream message;
            message << "dt sweep requires finite dt values > 0 (got " << dt << ")";
            return failed_report(message.str());
        }
    }

    if (!std::isfinite(options.reference_dt)) {
        return failed_report("dt sweep requires a finite reference dt");
    }

    const Real dt_min = *std::min_element(options.dt_values.begin(), options.dt_values.end());
    const Real dt_ref = options.reference_dt > 0.0 ? options.reference_dt : dt_min / 10.0;

    for (const Real dt : options.dt_values) {
        if (!sample_count(options.duration, dt)) {
            std::ostringstream message;
            message << "dt sweep: duration / dt exceeds the sample count limit (dt=" << dt << ")";
            return failed_report(message.str());
        }
    }
    if (!sample_count(options.duration, dt_ref)) {
        std::ostringstream message;
        message << "dt sweep: duration / reference dt exceeds the sample count limit (dt=" << dt_ref << ")";
        return failed_report(message.str());
    }

    SimulationOptions ref_opts;
    ref_opts.dt = dt_ref;
    ref_opts.neuron = options.neuron;
    ref_opts.bounds = options.bounds;

    const SimulationResult reference =
        simulate_exact(constant_current(options.duration, dt_ref, options.current), ref_opts);
    if (!reference.success) {
        return failed_report("Reference simulation failed: " + reference.message);
    }

    DtSweepReport report;
    report.reference_dt = dt_ref;
    report.reference_spike_count = reference.spike_count;
    report.reference_first_spike = first_spike_time(reference);

    // Exact runs at every dt serve as the same-grid baseline for voltage error
    std::vector<Vector> inputs;
    std::vector<SimulationResult> exact_runs;
    inputs.reserve(options.dt_values.size());
    exact_runs.reserve(options.dt_values.size());
    for (const Real dt : options.dt_values) {
        SimulationOptions opts = ref_opts;
        opts.dt = dt;
        inputs.push_back(constant_current(options.duration, dt, options.current));
        exact_runs.push_back(simulate_exact(inputs.back(), opts));
    }

    for (const Integrator method : kSweepOrder) {
        for (std::size_t k = 0; k < options.dt_values.size(); ++k) {
            SimulationOptions opts = ref_opts;
            opts.dt = options.dt_values[k];

            const SimulationResult run = method == Integrator::Exact
                ? exact_runs[k]
                : simulate(method, inputs[k], opts);

            IntegratorError row;
            row.method = method;
            row.dt = opts.dt;
            row.message = run.message;

            if (!run.success && !is_divergence(run.diagnostic)) {
                return failed_report(std::string(to_string(method)) + " run failed: " + run.message);
            }
            if (!run.success) {
                row.diverged = true;
                row.max_voltage_error = std::numeric_limits<Real>::infinity();
                report.rows.push_back(std::move(row));
                continue;
            }

            row.spike_count = run.spike_count;
            row.spike_count_error = run.spike_count - reference.spike_count;
            const auto first = first_spike_time(run);
            if (first && report.reference_first_spike) {
                row.first_spike_error = *first - *report.reference_first_spike;
            }
            row.max_voltage_error = max_voltage_error(run, exact_runs[k]);
            report.rows.push_back(std::move(row));
        }
    }

    report.message = "dt sweep completed";
    return report;
}

}  // namespace lifsim::v1
