#pragma once
#include "sg/core/scalar.hpp"

namespace sg {

// 1.0 / 0.0 results for control flow. Never require grad.
Scalar lt(const Scalar& a, const Scalar& b);
Scalar lt(const Scalar& a, double b);
Scalar lt(double a, const Scalar& b);

Scalar gt(const Scalar& a, const Scalar& b);
Scalar gt(const Scalar& a, double b);
Scalar gt(double a, const Scalar& b);

Scalar eq(const Scalar& a, const Scalar& b);
Scalar eq(const Scalar& a, double b);
Scalar eq(double a, const Scalar& b);

} // namespace sg
