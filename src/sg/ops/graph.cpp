#include "sg/ops/graph.hpp"

namespace sg {

Scalar stop_gradient(const Scalar& x) {
  auto n = std::make_shared<Node>();
  n->value = detail::checked(x, "stop_gradient")->value;
  n->requires_grad = false;
  return make_from_node(n);
}

Scalar detach(const Scalar& x) {
  return stop_gradient(x);
}

NoGradGuard::NoGradGuard() : prev_(sg::is_grad_enabled()) { sg::set_grad_enabled(false); }
NoGradGuard::~NoGradGuard() { sg::set_grad_enabled(prev_); }

} // namespace sg
