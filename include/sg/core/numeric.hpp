#pragma once
#include <cstddef>
#include <functional>
#include <vector>

#include "sg/core/scalar.hpp"

namespace sg {

// Central difference approximation of df/dx_arg at vals:
//   (f(x + eps*e_arg) - f(x - eps*e_arg)) / (2*eps)
// Throws std::out_of_range if arg >= vals.size().
double central_difference(const std::function<double(const std::vector<double>&)>& f,
                          std::vector<double> vals,
                          std::size_t arg,
                          double epsilon = 1e-6);

struct GradCheckResult {
  std::vector<double> analytic;
  std::vector<double> numeric;
  double max_abs_error = 0.0;
  bool ok = false;
};

// Builds one parameter per entry of vals, back-propagates f's output and
// compares each gradient with central_difference on the forward values.
GradCheckResult check_gradients(const std::function<Scalar(const std::vector<Scalar>&)>& f,
                                const std::vector<double>& vals,
                                double epsilon = 1e-6,
                                double tolerance = 1e-4);

} // namespace sg
