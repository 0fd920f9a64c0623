#pragma once

// =============================================================================
// LifSim v1 - Main Header
// =============================================================================
// Single LIF neuron under forward Euler, backward Euler and exact integration,
// plus the analytical reference, dt sweep harness and YAML experiment loader.
// =============================================================================

#include "lifsim/v1/numeric_types.hpp"
#include "lifsim/v1/neuron.hpp"
#include "lifsim/v1/integration.hpp"
#include "lifsim/v1/concepts.hpp"
#include "lifsim/v1/simulation.hpp"
#include "lifsim/v1/validation.hpp"
#include "lifsim/v1/parser/yaml_parser.hpp"
