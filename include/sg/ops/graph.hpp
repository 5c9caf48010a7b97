#pragma once
#include "sg/core/scalar.hpp"

namespace sg {
// Returns a detached copy: same value, no parents, requires_grad=false.
Scalar stop_gradient(const Scalar& x);

Scalar detach(const Scalar& x);

// Disables history recording on this thread for its lifetime.
struct NoGradGuard {
  NoGradGuard();
  ~NoGradGuard();
  NoGradGuard(const NoGradGuard&) = delete;
  NoGradGuard& operator=(const NoGradGuard&) = delete;
private:
  bool prev_;
};
} // namespace sg
