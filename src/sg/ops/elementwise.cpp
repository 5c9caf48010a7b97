#include "sg/ops/elementwise.hpp"
#include "sg/ops/apply.hpp"

namespace sg {
using detail::apply_binary;
using detail::apply_unary;

Scalar add(const Scalar& a, const Scalar& b) { return apply_binary<op::Add>(a, b, "add"); }
Scalar add(const Scalar& a, double b) { return add(a, constant(b)); }
Scalar add(double a, const Scalar& b) { return add(constant(a), b); }

Scalar sub(const Scalar& a, const Scalar& b) { return apply_binary<op::Sub>(a, b, "sub"); }
Scalar sub(const Scalar& a, double b) { return sub(a, constant(b)); }
Scalar sub(double a, const Scalar& b) { return sub(constant(a), b); }

Scalar mul(const Scalar& a, const Scalar& b) { return apply_binary<op::Mul>(a, b, "mul"); }
Scalar mul(const Scalar& a, double b) { return mul(a, constant(b)); }
Scalar mul(double a, const Scalar& b) { return mul(constant(a), b); }

Scalar div(const Scalar& a, const Scalar& b) { return apply_binary<op::Div>(a, b, "div"); }
Scalar div(const Scalar& a, double b) { return div(a, constant(b)); }
Scalar div(double a, const Scalar& b) { return div(constant(a), b); }

Scalar neg(const Scalar& x) { return apply_unary<op::Neg>(x, "neg"); }
Scalar inv(const Scalar& x) { return apply_unary<op::Inv>(x, "inv"); }

Scalar pow(const Scalar& base, const Scalar& exponent) {
  return apply_binary<op::Pow>(base, exponent, "pow");
}
Scalar pow(const Scalar& base, double exponent) { return pow(base, constant(exponent)); }
Scalar pow(double base, const Scalar& exponent) { return pow(constant(base), exponent); }

Scalar expv(const Scalar& x) { return apply_unary<op::Exp>(x, "exp"); }
Scalar logv(const Scalar& x) { return apply_unary<op::Log>(x, "log"); }

} // namespace sg
