#include "sg/core/scalar.hpp"
#include "sg/core/autodiff.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace {

std::uint64_t next_node_id() {
  static std::atomic<std::uint64_t> counter{1};
  return counter.fetch_add(1, std::memory_order_relaxed);
}

// every reachable node, constants included
std::vector<sg::Node*> collect_all(sg::Node* root) {
  std::vector<sg::Node*> out;
  std::vector<sg::Node*> stack{root};
  std::unordered_set<sg::Node*> seen{root};
  while (!stack.empty()) {
    sg::Node* node = stack.back();
    stack.pop_back();
    out.push_back(node);
    for (auto& p : node->parents) {
      if (p && seen.insert(p.get()).second) stack.push_back(p.get());
    }
  }
  return out;
}

} // anon

namespace sg {

Node::Node() : id(next_node_id()) {}

// Releasing a long chain through ~shared_ptr would recurse once per level.
// Parents whose last owner is this node are unlinked here instead.
Node::~Node() {
  std::vector<std::shared_ptr<Node>> dying;
  dying.swap(parents);
  while (!dying.empty()) {
    std::shared_ptr<Node> p = std::move(dying.back());
    dying.pop_back();
    if (p && p.use_count() == 1) {
      for (auto& q : p->parents) dying.push_back(std::move(q));
      p->parents.clear();
    }
  }
}

Scalar::Scalar() : n(std::make_shared<Node>()) {}
Scalar::Scalar(std::shared_ptr<Node> node) : n(std::move(node)) {}

Scalar::Scalar(double value, bool requires_grad) {
  n = std::make_shared<Node>();
  n->value = value;
  n->requires_grad = (requires_grad && sg::is_grad_enabled());
}

double Scalar::value() const { return n->value; }
double Scalar::grad()  const { return n->grad;  }
bool Scalar::requires_grad() const { return n->requires_grad; }
bool Scalar::is_leaf() const { return !n->op.has_value(); }
bool Scalar::is_constant() const { return !n->requires_grad; }
std::uint64_t Scalar::unique_id() const { return n->id; }

OpKind Scalar::op_kind() const {
  return n->op ? kind_of(*n->op) : OpKind::Leaf;
}

std::vector<Scalar> Scalar::parents() const {
  std::vector<Scalar> out;
  out.reserve(n->parents.size());
  for (auto& p : n->parents) out.push_back(make_from_node(p));
  return out;
}

void Scalar::zero_grad() {
  if (!n) return;
  for (auto* x : collect_all(n.get())) x->grad = 0.0;
}

void Scalar::backward(double seed) { backpropagate(*this, seed); }

Scalar make_from_node(std::shared_ptr<Node> node) { return Scalar(std::move(node)); }

Scalar constant(double value)  { return Scalar(value, /*requires_grad=*/false); }
Scalar parameter(double value) { return Scalar(value, /*requires_grad=*/true); }

namespace detail {

const std::shared_ptr<Node>& checked(const Scalar& s, const char* op) {
  if (!s.n) throw std::invalid_argument(std::string(op) + ": null scalar operand");
  return s.n;
}

Scalar record(double value, Op op, std::vector<std::shared_ptr<Node>> inputs) {
  auto out = std::make_shared<Node>();
  out->value = value;
  if (!sg::is_grad_enabled()) return make_from_node(out);

  bool any = false;
  for (auto& p : inputs) any = any || p->requires_grad;
  out->requires_grad = any && is_differentiable(kind_of(op));
  out->parents = std::move(inputs);
  out->op = std::move(op);
  return make_from_node(out);
}

} // namespace detail

} // namespace sg
