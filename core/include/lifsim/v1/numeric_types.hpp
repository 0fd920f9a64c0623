#pragma once

// =============================================================================
// LifSim v1 - Numeric Types
// =============================================================================
// Scalar and sequence types shared by the integrators, drivers and harness.
// Traces and input current sequences are dense Eigen column vectors.
// =============================================================================

#include <Eigen/Core>

namespace lifsim::v1 {

using Real = double;
using Index = Eigen::Index;
using Vector = Eigen::VectorXd;

}  // namespace lifsim::v1
