#include "sg/core/function.hpp"
#include "sg/core/errors.hpp"
#include <cmath>
#include <sstream>
#include <type_traits>

namespace sg {

namespace {

Grads unary(double g0) {
  Grads r; r.g = {g0, 0.0}; r.n = 1;
  return r;
}

Grads binary(double g0, double g1) {
  Grads r; r.g = {g0, g1}; r.n = 2;
  return r;
}

[[noreturn]] void domain_fail(const char* op, const char* why, double a) {
  std::ostringstream oss;
  oss << op << ": " << why << " (input=" << a << ")";
  throw DomainError(oss.str());
}

} // anon

const char* op_name(OpKind k) {
  switch (k) {
    case OpKind::Leaf:    return "leaf";
    case OpKind::Add:     return "add";
    case OpKind::Sub:     return "sub";
    case OpKind::Neg:     return "neg";
    case OpKind::Mul:     return "mul";
    case OpKind::Div:     return "div";
    case OpKind::Inv:     return "inv";
    case OpKind::Pow:     return "pow";
    case OpKind::Exp:     return "exp";
    case OpKind::Log:     return "log";
    case OpKind::Relu:    return "relu";
    case OpKind::Sigmoid: return "sigmoid";
    case OpKind::Lt:      return "lt";
    case OpKind::Gt:      return "gt";
    case OpKind::Eq:      return "eq";
  }
  return "unknown";
}

namespace op {

// ---- arithmetic ----
Forward<Add> Add::forward(double a, double b) { return {a + b, Add{}}; }
Grads Add::backward(double d_out) const { return binary(d_out, d_out); }

Forward<Sub> Sub::forward(double a, double b) { return {a - b, Sub{}}; }
Grads Sub::backward(double d_out) const { return binary(d_out, -d_out); }

Forward<Neg> Neg::forward(double a) { return {-a, Neg{}}; }
Grads Neg::backward(double d_out) const { return unary(-d_out); }

Forward<Mul> Mul::forward(double a, double b) { return {a * b, Mul{a, b}}; }
Grads Mul::backward(double d_out) const { return binary(d_out * b, d_out * a); }

Forward<Div> Div::forward(double a, double b) {
  if (b == 0.0) domain_fail("div", "division by zero", b);
  return {a / b, Div{a, b}};
}
Grads Div::backward(double d_out) const {
  return binary(d_out / b, -d_out * a / (b * b));
}

Forward<Inv> Inv::forward(double a) {
  if (a == 0.0) domain_fail("inv", "reciprocal of zero", a);
  return {1.0 / a, Inv{a}};
}
Grads Inv::backward(double d_out) const { return unary(-d_out / (a * a)); }

// d/dbase = e * base^(e-1); d/dexp = out * ln(base), taken as 0 where ln is undefined
Forward<Pow> Pow::forward(double base, double exponent) {
  if (base < 0.0 && std::floor(exponent) != exponent)
    domain_fail("pow", "negative base with non-integer exponent", base);
  if (base == 0.0 && exponent < 0.0)
    domain_fail("pow", "zero base with negative exponent", base);
  const double out = std::pow(base, exponent);
  return {out, Pow{base, exponent, out}};
}
Grads Pow::backward(double d_out) const {
  const double d_base = exponent == 0.0 ? 0.0 : exponent * std::pow(base, exponent - 1.0);
  const double d_exp  = base > 0.0 ? out * std::log(base) : 0.0;
  return binary(d_out * d_base, d_out * d_exp);
}

// ---- transcendental ----
Forward<Exp> Exp::forward(double a) {
  const double out = std::exp(a);
  return {out, Exp{out}};
}
Grads Exp::backward(double d_out) const { return unary(d_out * out); }

Forward<Log> Log::forward(double a) {
  if (a <= 0.0) domain_fail("log", "logarithm of non-positive value", a);
  return {std::log(a), Log{a}};
}
Grads Log::backward(double d_out) const { return unary(d_out / a); }

// ---- activations ----
// subgradient at exactly 0 is 0
Forward<Relu> Relu::forward(double a) { return {a > 0.0 ? a : 0.0, Relu{a}}; }
Grads Relu::backward(double d_out) const { return unary(a > 0.0 ? d_out : 0.0); }

Forward<Sigmoid> Sigmoid::forward(double a) {
  double s;
  if (a >= 0.0) {
    s = 1.0 / (1.0 + std::exp(-a));
  } else {
    const double e = std::exp(a);
    s = e / (1.0 + e);
  }
  return {s, Sigmoid{s}};
}
Grads Sigmoid::backward(double d_out) const { return unary(d_out * out * (1.0 - out)); }

// ---- comparisons ----
Forward<Lt> Lt::forward(double a, double b) { return {a < b ? 1.0 : 0.0, Lt{}}; }
Grads Lt::backward(double) const { return binary(0.0, 0.0); }

Forward<Gt> Gt::forward(double a, double b) { return {a > b ? 1.0 : 0.0, Gt{}}; }
Grads Gt::backward(double) const { return binary(0.0, 0.0); }

Forward<Eq> Eq::forward(double a, double b) { return {a == b ? 1.0 : 0.0, Eq{}}; }
Grads Eq::backward(double) const { return binary(0.0, 0.0); }

} // namespace op

OpKind kind_of(const Op& o) {
  return std::visit([](const auto& c) { return std::decay_t<decltype(c)>::kind; }, o);
}

std::size_t arity_of(const Op& o) {
  return std::visit([](const auto& c) { return std::decay_t<decltype(c)>::arity; }, o);
}

bool is_differentiable(OpKind k) {
  return k != OpKind::Leaf && k != OpKind::Lt && k != OpKind::Gt && k != OpKind::Eq;
}

Grads backward_rule(const Op& o, double d_out) {
  return std::visit([d_out](const auto& c) { return c.backward(d_out); }, o);
}

} // namespace sg
