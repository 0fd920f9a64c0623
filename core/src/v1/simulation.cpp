#include "lifsim/v1/simulation.hpp"

#include <cmath>
#include <sstream>

namespace lifsim::v1 {

std::string_view diagnostic_reason(SimulationDiagnosticCode code) noexcept {
    switch (code) {
        case SimulationDiagnosticCode::None:
            return "";
        case SimulationDiagnosticCode::InvalidTimestep:
            return "invalid_timestep";
        case SimulationDiagnosticCode::InvalidParameters:
            return "invalid_parameters";
        case SimulationDiagnosticCode::InvalidBounds:
            return "invalid_bounds";
        case SimulationDiagnosticCode::InvalidInput:
            return "invalid_input";
        case SimulationDiagnosticCode::NonFiniteVoltage:
            return "non_finite_voltage";
        case SimulationDiagnosticCode::VoltageOutOfBounds:
            return "voltage_out_of_bounds";
    }
    return "";
}

std::optional<SimulationIssue> validate_simulation_inputs(const Vector& current,
                                                          const SimulationOptions& options,
                                                          Integrator method) {
    if (!std::isfinite(options.dt) || options.dt <= 0.0) {
        return SimulationIssue{
            SimulationDiagnosticCode::InvalidTimestep,
            "Invalid timestep: dt must be finite and > 0"
        };
    }

    const LIFParameters& p = options.neuron;
    if (!p.all_finite()) {
        return SimulationIssue{
            SimulationDiagnosticCode::InvalidParameters,
            "Invalid neuron parameters: tau_m, v_rest, v_reset, v_th and R must be finite"
        };
    }
    if (p.tau_m <= 0.0 || p.R <= 0.0) {
        return SimulationIssue{
            SimulationDiagnosticCode::InvalidParameters,
            "Invalid neuron parameters: require tau_m > 0 and R > 0"
        };
    }

    if (requires_divergence_check(method)) {
        const DivergenceBounds& b = options.bounds;
        if (!std::isfinite(b.v_min) || !std::isfinite(b.v_max) || b.v_min > b.v_max) {
            return SimulationIssue{
                SimulationDiagnosticCode::InvalidBounds,
                "Invalid divergence bounds: v_min and v_max must be finite with v_min <= v_max"
            };
        }
    }

    if (!current.allFinite()) {
        for (Index n = 0; n < current.size(); ++n) {
            if (!std::isfinite(current[n])) {
                std::ostringstream message;
                message << "Input current contains non-finite value at step " << n;
                return SimulationIssue{SimulationDiagnosticCode::InvalidInput, message.str()};
            }
        }
    }

    return std::nullopt;
}

std::optional<SimulationIssue> check_divergence(Real v, Index step, const DivergenceBounds& bounds) {
    if (!std::isfinite(v)) {
        std::ostringstream message;
        message << "Non-finite voltage at step " << step << ": v=" << v;
        return SimulationIssue{SimulationDiagnosticCode::NonFiniteVoltage, message.str()};
    }

    if (!bounds.contains(v)) {
        std::ostringstream message;
        message << "Voltage out of bounds at step " << step << ": v=" << v
                << ", consider reducing dt or input strength";
        return SimulationIssue{SimulationDiagnosticCode::VoltageOutOfBounds, message.str()};
    }

    return std::nullopt;
}

SimulationResult make_failed_result(Integrator method, SimulationIssue issue) {
    SimulationResult result;
    result.method = method;
    result.success = false;
    result.diagnostic = issue.diagnostic;
    result.message = std::move(issue.message);
    return result;
}

SimulationResult simulate_forward(const Vector& current,
                                  const SimulationOptions& options,
                                  const StepCallback& callback) {
    return run_fixed_step<ForwardEulerStep>(current, options, callback);
}

SimulationResult simulate_backward(const Vector& current,
                                   const SimulationOptions& options,
                                   const StepCallback& callback) {
    return run_fixed_step<BackwardEulerStep>(current, options, callback);
}

SimulationResult simulate_exact(const Vector& current,
                                const SimulationOptions& options,
                                const StepCallback& callback) {
    return run_fixed_step<ExactStep>(current, options, callback);
}

SimulationResult simulate(Integrator method,
                          const Vector& current,
                          const SimulationOptions& options,
                          const StepCallback& callback) {
    switch (method) {
        case Integrator::ForwardEuler:
            return simulate_forward(current, options, callback);
        case Integrator::BackwardEuler:
            return simulate_backward(current, options, callback);
        case Integrator::Exact:
            return simulate_exact(current, options, callback);
    }
    return simulate_exact(current, options, callback);
}

}  // namespace lifsim::v1
