#include "sg/core/numeric.hpp"
#include "sg/ops/graph.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sg {

double central_difference(const std::function<double(const std::vector<double>&)>& f,
                          std::vector<double> vals,
                          std::size_t arg,
                          double epsilon) {
  if (arg >= vals.size()) throw std::out_of_range("central_difference: arg index out of range");
  const double x = vals[arg];
  vals[arg] = x + epsilon;
  const double hi = f(vals);
  vals[arg] = x - epsilon;
  const double lo = f(vals);
  return (hi - lo) / (2.0 * epsilon);
}

GradCheckResult check_gradients(const std::function<Scalar(const std::vector<Scalar>&)>& f,
                                const std::vector<double>& vals,
                                double epsilon,
                                double tolerance) {
  GradCheckResult r;

  std::vector<Scalar> params;
  params.reserve(vals.size());
  for (double v : vals) params.push_back(parameter(v));
  Scalar out = f(params);
  out.backward();
  for (const auto& p : params) r.analytic.push_back(p.grad());

  // forward-only evaluation; no graph is kept
  auto value_at = [&f](const std::vector<double>& xs) {
    NoGradGuard guard;
    std::vector<Scalar> in;
    in.reserve(xs.size());
    for (double x : xs) in.push_back(constant(x));
    return f(in).value();
  };

  for (std::size_t i = 0; i < vals.size(); ++i) {
    const double num = central_difference(value_at, vals, i, epsilon);
    r.numeric.push_back(num);
    r.max_abs_error = std::max(r.max_abs_error, std::fabs(num - r.analytic[i]));
  }
  r.ok = std::isfinite(r.max_abs_error) && r.max_abs_error < tolerance;
  return r;
}

} // namespace sg
