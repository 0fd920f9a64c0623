#pragma once

// =============================================================================
// LifSim v1 - Fixed-Step Simulation Drivers
// =============================================================================
// One driver per integration scheme. Each run starts at v = v_rest, applies
// one step per input sample and records time, voltage and spike indicator.
// Only the forward Euler driver checks for divergence. Failures are returned
// as a SimulationResult with success == false, never thrown.
// =============================================================================

#include "lifsim/v1/concepts.hpp"
#include "lifsim/v1/integration.hpp"
#include "lifsim/v1/neuron.hpp"
#include "lifsim/v1/numeric_types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lifsim::v1 {

// Streaming callback, invoked once per accepted step
using StepCallback = std::function<void(Real time, Real voltage, bool spike)>;

enum class SimulationDiagnosticCode {
    None,
    InvalidTimestep,
    InvalidParameters,
    InvalidBounds,
    InvalidInput,
    NonFiniteVoltage,
    VoltageOutOfBounds
};

/// Stable machine-readable reason for a diagnostic code
[[nodiscard]] std::string_view diagnostic_reason(SimulationDiagnosticCode code) noexcept;

/// True for the numerical divergence faults raised by the explicit scheme
[[nodiscard]] constexpr bool is_divergence(SimulationDiagnosticCode code) noexcept {
    return code == SimulationDiagnosticCode::NonFiniteVoltage ||
           code == SimulationDiagnosticCode::VoltageOutOfBounds;
}

struct SimulationOptions {
    Real dt = 1e-3;
    LIFParameters neuron{};
    DivergenceBounds bounds{};  // forward Euler only
};

struct SimulationResult {
    Integrator method = Integrator::Exact;

    Vector time;     // t[n] = n * dt
    Vector voltage;  // v after step n (reset already applied)
    Vector spikes;   // 1.0 where a spike was emitted at step n, else 0.0

    bool success = true;
    SimulationDiagnosticCode diagnostic = SimulationDiagnosticCode::None;
    std::string message;

    // Set when a divergence fault aborts the run
    Index failed_step = -1;
    Real failed_value = 0.0;

    Index total_steps = 0;
    Index spike_count = 0;
    double total_time_seconds = 0.0;
};

struct SimulationIssue {
    SimulationDiagnosticCode diagnostic = SimulationDiagnosticCode::None;
    std::string message;
};

/// Reject non-physical parameters and non-finite input before any step is taken.
/// Bounds are only checked for schemes that require a divergence check.
[[nodiscard]] std::optional<SimulationIssue> validate_simulation_inputs(
    const Vector& current,
    const SimulationOptions& options,
    Integrator method);

/// Divergence check applied to the integrated (pre-reset) voltage of step n
[[nodiscard]] std::optional<SimulationIssue> check_divergence(
    Real v,
    Index step,
    const DivergenceBounds& bounds);

[[nodiscard]] SimulationResult make_failed_result(Integrator method, SimulationIssue issue);

/// Generic fixed-step driver shared by all integration schemes
template<IntegrationStep Step>
[[nodiscard]] SimulationResult run_fixed_step(const Vector& current,
                                              const SimulationOptions& options,
                                              const StepCallback& callback = nullptr) {
    if (auto issue = validate_simulation_inputs(current, options, Step::method)) {
        return make_failed_result(Step::method, std::move(*issue));
    }

    const auto wall_start = std::chrono::steady_clock::now();
    const LIFParameters& params = options.neuron;
    const Real dt = options.dt;
    const Index steps = current.size();

    SimulationResult result;
    result.method = Step::method;
    result.time.resize(steps);
    result.voltage.resize(steps);
    result.spikes.resize(steps);

    Real v = params.v_rest;
    for (Index n = 0; n < steps; ++n) {
        const StepResult step = Step::step(v, current[n], dt, params);

        if constexpr (!Step::unconditionally_stable) {
            if (auto issue = check_divergence(step.v_integrated, n, options.bounds)) {
                SimulationResult failed = make_failed_result(Step::method, std::move(*issue));
                failed.failed_step = n;
                failed.failed_value = step.v_integrated;
                failed.total_steps = n;
                return failed;
            }
        }

        v = step.v_next;
        const Real t = static_cast<Real>(n) * dt;
        result.time[n] = t;
        result.voltage[n] = v;
        result.spikes[n] = step.spike ? 1.0 : 0.0;
        if (step.spike) {
            ++result.spike_count;
        }
        if (callback) {
            callback(t, v, step.spike);
        }
    }

    result.total_steps = steps;
    result.message = "Simulation completed";
    result.total_time_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - wall_start).count();
    return result;
}

[[nodiscard]] SimulationResult simulate_forward(const Vector& current,
                                                const SimulationOptions& options = {},
                                                const StepCallback& callback = nullptr);

[[nodiscard]] SimulationResult simulate_backward(const Vector& current,
                                                 const SimulationOptions& options = {},
                                                 const StepCallback& callback = nullptr);

[[nodiscard]] SimulationResult simulate_exact(const Vector& current,
                                              const SimulationOptions& options = {},
                                              const StepCallback& callback = nullptr);

/// Runtime dispatch to the driver for the given scheme
[[nodiscard]] SimulationResult simulate(Integrator method,
                                        const Vector& current,
                                        const SimulationOptions& options = {},
                                        const StepCallback& callback = nullptr);

}  // namespace lifsim::v1
