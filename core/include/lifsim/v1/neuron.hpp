#pragma once

// =============================================================================
// LifSim v1 - Leaky Integrate-and-Fire Neuron Parameters
// =============================================================================
// Membrane dynamics:  tau_m * dv/dt = -(v - v_rest) + R * I
// Spike when v >= v_th, followed immediately by v <- v_reset.
// =============================================================================

#include "lifsim/v1/numeric_types.hpp"

#include <cmath>

namespace lifsim::v1 {

/// Per-run neuron constants. Never mutated while a simulation is running.
struct LIFParameters {
    Real tau_m = 20e-3;   // Membrane time constant (s), must be > 0
    Real v_rest = 0.0;    // Resting potential
    Real v_reset = 0.0;   // Potential after a spike
    Real v_th = 1.0;      // Spike threshold (expected > v_reset, not enforced)
    Real R = 1.0;         // Membrane resistance, must be > 0

    /// Voltage the membrane relaxes to under constant input I
    [[nodiscard]] constexpr Real steady_state(Real I) const noexcept {
        return v_rest + R * I;
    }

    [[nodiscard]] bool all_finite() const noexcept {
        return std::isfinite(tau_m) && std::isfinite(v_rest) && std::isfinite(v_reset) &&
               std::isfinite(v_th) && std::isfinite(R);
    }
};

/// Admissible voltage window for the explicit integrator's divergence check
struct DivergenceBounds {
    Real v_min = -1e3;
    Real v_max = 1e3;

    [[nodiscard]] bool contains(Real v) const noexcept {
        return v >= v_min && v <= v_max;
    }
};

}  // namespace lifsim::v1
