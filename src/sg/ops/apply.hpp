#pragma once
#include "sg/core/scalar.hpp"

namespace sg::detail {

// Runs a primitive's forward rule on the operand values and records the
// result node. DomainError from forward() leaves no node behind.
template <class Prim>
inline Scalar apply_unary(const Scalar& x, const char* name) {
  const auto& xn = checked(x, name);
  auto f = Prim::forward(xn->value);
  return record(f.value, Op{std::move(f.ctx)}, {xn});
}

template <class Prim>
inline Scalar apply_binary(const Scalar& a, const Scalar& b, const char* name) {
  const auto& an = checked(a, name);
  const auto& bn = checked(b, name);
  auto f = Prim::forward(an->value, bn->value);
  return record(f.value, Op{std::move(f.ctx)}, {an, bn});
}

} // namespace sg::detail
