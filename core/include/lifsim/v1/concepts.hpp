#pragma once

// =============================================================================
// LifSim v1 - Concepts for Integration Step Policies
// =============================================================================

#include "lifsim/v1/integration.hpp"

#include <concepts>

namespace lifsim::v1 {

/// A stateless integration step for the LIF membrane equation.
/// Drivers are instantiated per policy; there is no virtual dispatch.
template<typename S>
concept IntegrationStep = requires(Real v, Real I, Real dt, const LIFParameters& p) {
    { S::method } -> std::convertible_to<Integrator>;
    { S::unconditionally_stable } -> std::convertible_to<bool>;
    { S::step(v, I, dt, p) } -> std::same_as<StepResult>;
};

static_assert(IntegrationStep<ForwardEulerStep>);
static_assert(IntegrationStep<BackwardEulerStep>);
static_assert(IntegrationStep<ExactStep>);

}  // namespace lifsim::v1
