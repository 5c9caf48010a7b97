#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "sg/core/function.hpp"

namespace sg {

// Global grad mode (thread-local). Controls whether new nodes record history.
inline thread_local bool _grad_enabled = true;
inline bool is_grad_enabled() { return _grad_enabled; }
inline void set_grad_enabled(bool v) { _grad_enabled = v; }


struct Node {
  double value = 0.0;                         // fixed at construction
  double grad = 0.0;                          // dL/d(this), written by backward passes
  bool requires_grad = false;
  std::uint64_t id = 0;                       // process-unique, increasing

  std::vector<std::shared_ptr<Node>> parents; // inputs, in op argument order
  std::optional<Op> op;                       // empty for leaves

  Node();
  ~Node();
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;
};

class Scalar {
public:
  Scalar();                                            // constant 0
  explicit Scalar(double value, bool requires_grad = false);
  explicit Scalar(std::shared_ptr<Node> node);         // wrap existing

  double value() const;
  double grad() const;
  bool requires_grad() const;

  bool is_leaf() const;
  bool is_constant() const;
  std::uint64_t unique_id() const;
  OpKind op_kind() const;
  std::vector<Scalar> parents() const;

  void zero_grad();                  // zero across reachable subgraph
  void backward(double seed = 1.0);  // reverse-mode pass rooted here

  // expose node handle for ops implementation
  std::shared_ptr<Node> n;
};

Scalar make_from_node(std::shared_ptr<Node> node);

// Leaf factories. Bare numbers enter a graph only through these.
Scalar constant(double value);
Scalar parameter(double value);

namespace detail {
// Builds the result node of a primitive from its forward output. History is
// recorded only while grad mode is on; differentiable results require grad
// when any input does.
Scalar record(double value, Op op, std::vector<std::shared_ptr<Node>> inputs);

const std::shared_ptr<Node>& checked(const Scalar& s, const char* op);
} // namespace detail

} // namespace sg
