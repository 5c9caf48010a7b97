#pragma once
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

#include "sg/core/scalar.hpp"

namespace sg {

// Gradient table for one backward pass. Keeps the nodes it mentions alive so
// the table can be applied after the caller drops its graph handles.
class GradSink {
public:
  void accumulate(const std::shared_ptr<Node>& node, double g);
  double get(const Node* node) const;   // 0 when absent
  bool contains(const Node* node) const;
  std::size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }

  void merge(const GradSink& other);
  // Adds every entry into Node::grad, in first-insertion order.
  void apply() const;
  void clear();

private:
  std::unordered_map<const Node*, std::size_t> index_;
  std::vector<std::shared_ptr<Node>> order_;
  std::vector<double> grads_;
};

// Nodes reachable from root that require grad, root first; every node comes
// before all of its parents. Each node appears once.
std::vector<std::shared_ptr<Node>> topological_sort(const Scalar& root);

// Runs the chain rule from root into `sink` without touching Node::grad.
void backpropagate_into(const Scalar& root, double seed, GradSink& sink);

// backpropagate_into + apply: adds this pass's dL/d(node) into every
// visited node's grad.
void backpropagate(const Scalar& root, double seed = 1.0);

} // namespace sg
