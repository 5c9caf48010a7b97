#pragma once
// Umbrella header to simplify includes from bindings and examples.

// Core
#include "sg/core/errors.hpp"
#include "sg/core/function.hpp"
#include "sg/core/scalar.hpp"
#include "sg/core/autodiff.hpp"
#include "sg/core/batch.hpp"
#include "sg/core/numeric.hpp"

// Ops
#include "sg/ops/elementwise.hpp"
#include "sg/ops/activations.hpp"
#include "sg/ops/compare.hpp"
#include "sg/ops/graph.hpp"

// End of umbrella
