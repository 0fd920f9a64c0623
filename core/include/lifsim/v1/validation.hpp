#pragma once

// =============================================================================
// LifSim v1 - Validation & Integrator Comparison
// =============================================================================
// This header provides:
// - Analytical LIF response to constant current (trajectory, first spike, ISI)
// - Input helpers and spike-train extraction
// - dt sweep comparing all integrators against a fine exact reference
// =============================================================================

#include "lifsim/v1/integration.hpp"
#include "lifsim/v1/neuron.hpp"
#include "lifsim/v1/numeric_types.hpp"
#include "lifsim/v1/simulation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lifsim::v1 {

// =============================================================================
// Analytical Solution
// =============================================================================

/// Closed-form response of the LIF membrane to constant input I starting at v0:
/// v(t) = v_inf + (v0 - v_inf) * exp(-t / tau_m),  v_inf = v_rest + R*I
struct LIFAnalytical {
    LIFParameters params{};
    Real current = 0.0;
    Real v0 = 0.0;

    [[nodiscard]] Real steady_state() const { return params.steady_state(current); }

    /// Subthreshold trajectory (no reset applied)
    [[nodiscard]] Real voltage(Real t) const;

    /// Time at which v(t) first reaches v_th, if it ever does
    [[nodiscard]] std::optional<Real> first_spike_time() const;

    /// Time from v_reset back up to v_th under the same input
    [[nodiscard]] std::optional<Real> interspike_interval() const;

    /// Regular firing rate (Hz), 0 when the neuron never fires
    [[nodiscard]] Real firing_rate() const;
};

// =============================================================================
// Input and Spike Train Helpers
// =============================================================================

/// floor(duration / dt), taken with a small relative tolerance so that
/// 1.0 / 1e-5 yields 100000. Absent when duration or dt is not finite and > 0,
/// or when the count does not fit in Index.
[[nodiscard]] std::optional<Index> sample_count(Real duration, Real dt);

/// sample_count(duration, dt) samples of a constant current; empty when the
/// count is absent.
[[nodiscard]] Vector constant_current(Real duration, Real dt, Real value);

/// Times t[n] for which a spike was recorded
[[nodiscard]] std::vector<Real> spike_times(const SimulationResult& result);

[[nodiscard]] std::optional<Real> first_spike_time(const SimulationResult& result);

/// Max |v_a - v_b| over two traces sampled on the same grid.
/// Throws std::invalid_argument when the traces differ in length.
[[nodiscard]] Real max_voltage_error(const SimulationResult& a, const SimulationResult& b);

// =============================================================================
// dt Sweep
// =============================================================================

struct DtSweepOptions {
    std::vector<Real> dt_values{0.1e-3, 0.5e-3, 1e-3, 2e-3, 5e-3};
    Real duration = 1.0;
    Real current = 1.5;
    Real reference_dt = 0.0;  // <= 0 selects min(dt_values) / 10
    LIFParameters neuron{};
    DivergenceBounds bounds{};
};

struct IntegratorError {
    Integrator method = Integrator::Exact;
    Real dt = 0.0;
    Index spike_count = 0;
    Index spike_count_error = 0;            // spike_count - reference count
    std::optional<Real> first_spike_error;  // t_first - t_first_ref
    Real max_voltage_error = 0.0;           // vs exact integration at the same dt
    bool diverged = false;
    std::string message;
};

struct DtSweepReport {
    bool success = true;
    std::string message;

    Real reference_dt = 0.0;
    Index reference_spike_count = 0;
    std::optional<Real> reference_first_spike;

    // Ordered by integrator (forward, backward, exact), then by dt_values order
    std::vector<IntegratorError> rows;

    [[nodiscard]] std::vector<IntegratorError> rows_for(Integrator method) const;
};

[[nodiscard]] DtSweepReport compare_dt_errors(const DtSweepOptions& options);

}  // namespace lifsim::v1
