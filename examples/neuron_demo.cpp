// examples/neuron_demo.cpp: single sigmoid neuron trained on an AND gate
// - one graph per sample, gradients reduced with backward_batch
// - plain gradient descent; parameters are rebuilt each step since node
//   values are immutable

#include <iomanip>
#include <iostream>
#include <vector>
#include "sg/all.hpp"

struct Sample { double x1, x2, y; };

int main() {
  const std::vector<Sample> data = {
    {0.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {1.0, 0.0, 0.0}, {1.0, 1.0, 1.0},
  };

  double w1 = 0.1, w2 = -0.1, b = 0.0;
  const double lr = 2.0;

  for (int step = 0; step < 500; ++step) {
    sg::Scalar pw1 = sg::parameter(w1);
    sg::Scalar pw2 = sg::parameter(w2);
    sg::Scalar pb  = sg::parameter(b);

    // binary cross-entropy per sample, scaled by 1/N
    std::vector<sg::Scalar> losses;
    double total = 0.0;
    for (const auto& s : data) {
      sg::Scalar z = sg::add(sg::add(sg::mul(pw1, s.x1), sg::mul(pw2, s.x2)), pb);
      sg::Scalar p = sg::sigmoid(z);
      sg::Scalar l = s.y > 0.5 ? sg::neg(sg::logv(p))
                               : sg::neg(sg::logv(sg::sub(1.0, p)));
      l = sg::div(l, static_cast<double>(data.size()));
      total += l.value();
      losses.push_back(l);
    }

    sg::backward_batch(losses);

    w1 -= lr * pw1.grad();
    w2 -= lr * pw2.grad();
    b  -= lr * pb.grad();

    if (step == 0 || (step + 1) % 100 == 0) {
      std::cout << "step " << step + 1
                << " loss=" << std::fixed << std::setprecision(6) << total << "\n";
    }
  }

  for (const auto& s : data) {
    sg::NoGradGuard guard;
    const double z = w1 * s.x1 + w2 * s.x2 + b;
    const double p = sg::sigmoid(sg::constant(z)).value();
    std::cout << s.x1 << " AND " << s.x2 << " -> " << std::setprecision(4) << p << "\n";
  }
  return 0;
}
