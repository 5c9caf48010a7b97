#pragma once
#include <array>
#include <cstddef>
#include <variant>

namespace sg {

enum class OpKind {
  Leaf,
  Add, Sub, Neg, Mul, Div, Inv, Pow,
  Exp, Log, Relu, Sigmoid,
  Lt, Gt, Eq
};

const char* op_name(OpKind k);

// Per-input gradients returned by a backward rule (n == arity).
struct Grads {
  std::array<double, 2> g{};
  std::size_t n = 0;

  double operator[](std::size_t i) const { return g[i]; }
  std::size_t size() const { return n; }
};

// Output of a forward rule: the value plus whatever the backward rule needs.
template <class Ctx>
struct Forward {
  double value;
  Ctx ctx;
};

// ===== Primitive registry =====
// Each primitive keeps its forward and backward rule together. forward() is
// pure and throws DomainError outside the primitive's domain.
namespace op {

struct Add {
  static constexpr OpKind kind = OpKind::Add;
  static constexpr std::size_t arity = 2;
  static Forward<Add> forward(double a, double b);
  Grads backward(double d_out) const;
};

struct Sub {
  static constexpr OpKind kind = OpKind::Sub;
  static constexpr std::size_t arity = 2;
  static Forward<Sub> forward(double a, double b);
  Grads backward(double d_out) const;
};

struct Neg {
  static constexpr OpKind kind = OpKind::Neg;
  static constexpr std::size_t arity = 1;
  static Forward<Neg> forward(double a);
  Grads backward(double d_out) const;
};

struct Mul {
  static constexpr OpKind kind = OpKind::Mul;
  static constexpr std::size_t arity = 2;
  double a = 0.0, b = 0.0;
  static Forward<Mul> forward(double a, double b);
  Grads backward(double d_out) const;
};

struct Div {
  static constexpr OpKind kind = OpKind::Div;
  static constexpr std::size_t arity = 2;
  double a = 0.0, b = 0.0;
  static Forward<Div> forward(double a, double b);
  Grads backward(double d_out) const;
};

struct Inv {
  static constexpr OpKind kind = OpKind::Inv;
  static constexpr std::size_t arity = 1;
  double a = 0.0;
  static Forward<Inv> forward(double a);
  Grads backward(double d_out) const;
};

struct Pow {
  static constexpr OpKind kind = OpKind::Pow;
  static constexpr std::size_t arity = 2;
  double base = 0.0, exponent = 0.0, out = 0.0;
  static Forward<Pow> forward(double base, double exponent);
  Grads backward(double d_out) const;
};

struct Exp {
  static constexpr OpKind kind = OpKind::Exp;
  static constexpr std::size_t arity = 1;
  double out = 0.0;
  static Forward<Exp> forward(double a);
  Grads backward(double d_out) const;
};

struct Log {
  static constexpr OpKind kind = OpKind::Log;
  static constexpr std::size_t arity = 1;
  double a = 0.0;
  static Forward<Log> forward(double a);
  Grads backward(double d_out) const;
};

struct Relu {
  static constexpr OpKind kind = OpKind::Relu;
  static constexpr std::size_t arity = 1;
  double a = 0.0;
  static Forward<Relu> forward(double a);
  Grads backward(double d_out) const;
};

struct Sigmoid {
  static constexpr OpKind kind = OpKind::Sigmoid;
  static constexpr std::size_t arity = 1;
  double out = 0.0;
  static Forward<Sigmoid> forward(double a);
  Grads backward(double d_out) const;
};

// Comparisons are step functions: zero gradient everywhere.
struct Lt {
  static constexpr OpKind kind = OpKind::Lt;
  static constexpr std::size_t arity = 2;
  static Forward<Lt> forward(double a, double b);
  Grads backward(double d_out) const;
};

struct Gt {
  static constexpr OpKind kind = OpKind::Gt;
  static constexpr std::size_t arity = 2;
  static Forward<Gt> forward(double a, double b);
  Grads backward(double d_out) const;
};

struct Eq {
  static constexpr OpKind kind = OpKind::Eq;
  static constexpr std::size_t arity = 2;
  static Forward<Eq> forward(double a, double b);
  Grads backward(double d_out) const;
};

} // namespace op

using Op = std::variant<op::Add, op::Sub, op::Neg, op::Mul, op::Div, op::Inv, op::Pow,
                        op::Exp, op::Log, op::Relu, op::Sigmoid,
                        op::Lt, op::Gt, op::Eq>;

// Dispatch over the closed op set.
OpKind kind_of(const Op& o);
std::size_t arity_of(const Op& o);
bool is_differentiable(OpKind k);
Grads backward_rule(const Op& o, double d_out);

} // namespace sg
