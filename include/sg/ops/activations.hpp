#pragma once
#include "sg/core/scalar.hpp"

namespace sg {

Scalar relu(const Scalar& x);
Scalar sigmoid(const Scalar& x);

} // namespace sg
