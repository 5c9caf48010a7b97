#include "sg/core/autodiff.hpp"
#include "sg/core/errors.hpp"
#include "sg/sys/trace.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace {

// Parents-first DFS with an explicit (node, next parent) stack, so graph
// depth is bounded by memory rather than the call stack. reverse(order) is
// used for backprop.
void topo_collect(const std::shared_ptr<sg::Node>& root,
                  std::vector<std::shared_ptr<sg::Node>>& order,
                  std::unordered_set<const sg::Node*>& seen) {
  if (!root) throw sg::GraphConsistencyError("null node in computation graph");
  if (!root->requires_grad) return;

  std::vector<std::pair<const std::shared_ptr<sg::Node>*, std::size_t>> stack;
  seen.insert(root.get());
  stack.emplace_back(&root, 0);
  while (!stack.empty()) {
    auto& top = stack.back();
    const auto& node = *top.first;
    if (top.second < node->parents.size()) {
      const auto& p = node->parents[top.second++];
      if (!p) throw sg::GraphConsistencyError("null node in computation graph");
      if (!p->requires_grad || !seen.insert(p.get()).second) continue;
      stack.emplace_back(&p, 0);
    } else {
      order.push_back(node);
      stack.pop_back();
    }
  }
}

void check_node(const sg::Node& node) {
  if (!node.op) {
    if (!node.parents.empty())
      throw sg::GraphConsistencyError("node without an operation has parents");
    return;
  }
  const std::size_t arity = sg::arity_of(*node.op);
  if (node.parents.size() != arity) {
    std::ostringstream oss;
    oss << sg::op_name(sg::kind_of(*node.op)) << " node has " << node.parents.size()
        << " parents, expected " << arity;
    throw sg::GraphConsistencyError(oss.str());
  }
}

} // anon

namespace sg {

// ===== GradSink =====

void GradSink::accumulate(const std::shared_ptr<Node>& node, double g) {
  auto it = index_.find(node.get());
  if (it == index_.end()) {
    index_.emplace(node.get(), order_.size());
    order_.push_back(node);
    grads_.push_back(g);
  } else {
    grads_[it->second] += g;
  }
}

double GradSink::get(const Node* node) const {
  auto it = index_.find(node);
  return it == index_.end() ? 0.0 : grads_[it->second];
}

bool GradSink::contains(const Node* node) const { return index_.count(node) != 0; }

void GradSink::merge(const GradSink& other) {
  for (std::size_t i = 0; i < other.order_.size(); ++i)
    accumulate(other.order_[i], other.grads_[i]);
}

void GradSink::apply() const {
  for (std::size_t i = 0; i < order_.size(); ++i) order_[i]->grad += grads_[i];
}

void GradSink::clear() {
  index_.clear();
  order_.clear();
  grads_.clear();
}

// ===== Backward pass =====

std::vector<std::shared_ptr<Node>> topological_sort(const Scalar& root) {
  std::vector<std::shared_ptr<Node>> order;
  std::unordered_set<const Node*> seen;
  topo_collect(root.n, order, seen);
  return std::vector<std::shared_ptr<Node>>(order.rbegin(), order.rend());
}

void backpropagate_into(const Scalar& root, double seed, GradSink& sink) {
  if (!std::isfinite(seed)) throw std::invalid_argument("backward: seed must be finite");
  if (!root.n) throw std::invalid_argument("backward: null root");
  if (!root.n->requires_grad) return;

  const auto order = topological_sort(root);
  SG_TRACE_SCOPE("backward");
  sys::trace_event("backward: ", order.size(), " nodes from id=", root.n->id);

  // Pass-local accumulators; a node's entry is final once every consumer
  // (all earlier in `order`) has been processed.
  std::unordered_map<const Node*, double> pending;
  pending[root.n.get()] = seed;

  for (const auto& node : order) {
    check_node(*node);
    const double d = pending[node.get()];
    sink.accumulate(node, d);
    if (!node->op) continue;

    const Grads g = backward_rule(*node->op, d);
    for (std::size_t i = 0; i < g.size(); ++i) {
      const auto& p = node->parents[i];
      if (!p) throw GraphConsistencyError("null parent in computation graph");
      if (p->requires_grad) pending[p.get()] += g[i];
    }
  }
}

void backpropagate(const Scalar& root, double seed) {
  GradSink sink;
  backpropagate_into(root, seed, sink);
  sink.apply();
}

} // namespace sg
