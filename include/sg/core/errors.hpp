#pragma once
#include <stdexcept>
#include <string>

namespace sg {

// Raised while building a node whose primitive is undefined at its inputs
// (zero divisor, log of a non-positive value, ...). The node is not created.
struct DomainError : public std::domain_error {
  explicit DomainError(const std::string& what) : std::domain_error(what) {}
};

// Raised by the backward pass when a node's recorded history is malformed.
struct GraphConsistencyError : public std::logic_error {
  explicit GraphConsistencyError(const std::string& what) : std::logic_error(what) {}
};

} // namespace sg
