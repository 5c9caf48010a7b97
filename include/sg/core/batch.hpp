#pragma once
#include <vector>

#include "sg/core/scalar.hpp"

namespace sg {

// Back-propagates every root (seeded with `seed`) into its own GradSink on the
// worker pool, then applies the sinks in root order on the calling thread.
// Roots may share parameter nodes; the result equals calling backward() on
// each root in turn. If any pass throws, nothing is applied and the first
// exception is rethrown.
void backward_batch(const std::vector<Scalar>& roots, double seed = 1.0);

} // namespace sg
