#include "sg/ops/activations.hpp"
#include "sg/ops/apply.hpp"

namespace sg {

Scalar relu(const Scalar& x) { return detail::apply_unary<op::Relu>(x, "relu"); }

Scalar sigmoid(const Scalar& x) { return detail::apply_unary<op::Sigmoid>(x, "sigmoid"); }

} // namespace sg
