#pragma once
#include "sg/core/scalar.hpp"

namespace sg {

// Arithmetic. Overloads taking a double wrap it with constant() first.
Scalar add(const Scalar& a, const Scalar& b);
Scalar add(const Scalar& a, double b);
Scalar add(double a, const Scalar& b);

Scalar sub(const Scalar& a, const Scalar& b);
Scalar sub(const Scalar& a, double b);
Scalar sub(double a, const Scalar& b);

Scalar mul(const Scalar& a, const Scalar& b);
Scalar mul(const Scalar& a, double b);
Scalar mul(double a, const Scalar& b);

// Throws DomainError when the divisor is exactly zero.
Scalar div(const Scalar& a, const Scalar& b);
Scalar div(const Scalar& a, double b);
Scalar div(double a, const Scalar& b);

Scalar neg(const Scalar& x);
Scalar inv(const Scalar& x);

// Throws DomainError for a negative base with non-integer exponent, and for
// a zero base with negative exponent.
Scalar pow(const Scalar& base, const Scalar& exponent);
Scalar pow(const Scalar& base, double exponent);
Scalar pow(double base, const Scalar& exponent);

Scalar expv(const Scalar& x);
Scalar logv(const Scalar& x);   // throws DomainError for x <= 0

} // namespace sg
