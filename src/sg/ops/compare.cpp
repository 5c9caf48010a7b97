#include "sg/ops/compare.hpp"
#include "sg/ops/apply.hpp"

namespace sg {
using detail::apply_binary;

Scalar lt(const Scalar& a, const Scalar& b) { return apply_binary<op::Lt>(a, b, "lt"); }
Scalar lt(const Scalar& a, double b) { return lt(a, constant(b)); }
Scalar lt(double a, const Scalar& b) { return lt(constant(a), b); }

Scalar gt(const Scalar& a, const Scalar& b) { return apply_binary<op::Gt>(a, b, "gt"); }
Scalar gt(const Scalar& a, double b) { return gt(a, constant(b)); }
Scalar gt(double a, const Scalar& b) { return gt(constant(a), b); }

Scalar eq(const Scalar& a, const Scalar& b) { return apply_binary<op::Eq>(a, b, "eq"); }
Scalar eq(const Scalar& a, double b) { return eq(a, constant(b)); }
Scalar eq(double a, const Scalar& b) { return eq(constant(a), b); }

} // namespace sg
