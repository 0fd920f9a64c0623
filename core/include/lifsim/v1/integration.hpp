#pragma once

// =============================================================================
// LifSim v1 - Integration Steps for the LIF Membrane Equation
// =============================================================================
// This header provides:
// - Forward (explicit) Euler step, conditionally stable
// - Backward (implicit) Euler step, closed form, unconditionally stable
// - Exact exponential step for piecewise-constant input
// - Shared threshold/reset rule
// - Step policies conforming to the IntegrationStep concept
// =============================================================================

#include "lifsim/v1/neuron.hpp"
#include "lifsim/v1/numeric_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>

namespace lifsim::v1 {

// =============================================================================
// Integration Method Types
// =============================================================================

enum class Integrator {
    ForwardEuler,   // First-order explicit, stable only for dt < 2 * tau_m
    BackwardEuler,  // First-order implicit, L-stable
    Exact           // Exponential integrator, exact for piecewise-constant input
};

[[nodiscard]] constexpr const char* to_string(Integrator m) noexcept {
    switch (m) {
        case Integrator::ForwardEuler: return "forward";
        case Integrator::BackwardEuler: return "backward";
        case Integrator::Exact: return "exact";
    }
    return "unknown";
}

/// Whether the scheme can blow up for large dt / tau_m
[[nodiscard]] constexpr bool requires_divergence_check(Integrator m) noexcept {
    return m == Integrator::ForwardEuler;
}

/// Parse an integrator name (case-insensitive). Accepts short names and aliases.
[[nodiscard]] inline std::optional<Integrator> parse_integrator(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "forward" || key == "forward_euler" || key == "explicit" || key == "euler") {
        return Integrator::ForwardEuler;
    }
    if (key == "backward" || key == "backward_euler" || key == "implicit" || key == "bdf1") {
        return Integrator::BackwardEuler;
    }
    if (key == "exact" || key == "exponential") {
        return Integrator::Exact;
    }
    return std::nullopt;
}

// =============================================================================
// Step Results and Threshold/Reset
// =============================================================================

struct StepResult {
    Real v_next = 0.0;        // Voltage carried to the next step (after reset)
    bool spike = false;
    Real v_integrated = 0.0;  // Integrated voltage before threshold/reset
};

/// Threshold-reset rule shared by all schemes: spike iff v >= v_th, and the
/// stored voltage is v_reset whenever a spike is emitted.
[[nodiscard]] constexpr StepResult apply_threshold_reset(Real v_integrated,
                                                         const LIFParameters& p) noexcept {
    StepResult r;
    r.v_integrated = v_integrated;
    r.spike = v_integrated >= p.v_th;
    r.v_next = r.spike ? p.v_reset : v_integrated;
    return r;
}

// =============================================================================
// Step Functions
// =============================================================================

/// Forward Euler:  v' = v + dt/tau_m * (-(v - v_rest) + R*I)
[[nodiscard]] constexpr StepResult step_forward(Real v, Real I, Real dt,
                                                const LIFParameters& p) noexcept {
    const Real dv = (-(v - p.v_rest) + p.R * I) * (dt / p.tau_m);
    return apply_threshold_reset(v + dv, p);
}

/// Backward Euler, solved in closed form since the ODE is linear in v:
///   v' = (v + alpha * v_inf) / (1 + alpha),  alpha = dt / tau_m
/// Evaluated as v_inf + (v - v_inf) / (1 + alpha) so that alpha -> inf stays finite.
[[nodiscard]] constexpr StepResult step_backward(Real v, Real I, Real dt,
                                                 const LIFParameters& p) noexcept {
    const Real alpha = dt / p.tau_m;
    const Real v_inf = p.steady_state(I);
    return apply_threshold_reset(v_inf + (v - v_inf) / (1.0 + alpha), p);
}

/// Exact solution over one step of constant input:
///   v' = v_inf + (v - v_inf) * exp(-dt / tau_m),  v_inf = v_rest + R*I
[[nodiscard]] inline StepResult step_exact(Real v, Real I, Real dt,
                                           const LIFParameters& p) noexcept {
    const Real a = std::exp(-dt / p.tau_m);
    const Real v_inf = p.steady_state(I);
    return apply_threshold_reset(v_inf + (v - v_inf) * a, p);
}

// =============================================================================
// Step Policies
// =============================================================================

struct ForwardEulerStep {
    static constexpr Integrator method = Integrator::ForwardEuler;
    static constexpr bool unconditionally_stable = false;

    [[nodiscard]] static constexpr StepResult step(Real v, Real I, Real dt,
                                                   const LIFParameters& p) noexcept {
        return step_forward(v, I, dt, p);
    }
};

struct BackwardEulerStep {
    static constexpr Integrator method = Integrator::BackwardEuler;
    static constexpr bool unconditionally_stable = true;

    [[nodiscard]] static constexpr StepResult step(Real v, Real I, Real dt,
                                                   const LIFParameters& p) noexcept {
        return step_backward(v, I, dt, p);
    }
};

struct ExactStep {
    static constexpr Integrator method = Integrator::Exact;
    static constexpr bool unconditionally_stable = true;

    [[nodiscard]] static StepResult step(Real v, Real I, Real dt,
                                         const LIFParameters& p) noexcept {
        return step_exact(v, I, dt, p);
    }
};

}  // namespace lifsim::v1
