// tests/test_end_to_end.cpp
#include "test_framework.hpp"
#include <cmath>
#include <vector>

#include "sg/core/batch.hpp"
#include "sg/ops/activations.hpp"
#include "sg/ops/elementwise.hpp"
#include "sg/ops/graph.hpp"

using sg::Scalar;
using sg::parameter;
using sg::constant;

TEST("e2e/sigmoid_neuron_gradients") {
    Scalar x = parameter(1.0), w = parameter(2.0), b = parameter(-1.0);
    Scalar z = sg::sigmoid(sg::add(sg::mul(x, w), b));
    z.backward();
    const double s = 1.0 / (1.0 + std::exp(-1.0));
    ASSERT_NEAR(z.value(), 0.7311, 1e-3);
    ASSERT_NEAR(z.value(), s, 1e-12);
    ASSERT_NEAR(w.grad(), 0.1966, 1e-3);
    ASSERT_NEAR(b.grad(), 0.1966, 1e-3);
    ASSERT_NEAR(x.grad(), 0.3932, 1e-3);
    ASSERT_NEAR(x.grad(), 2.0 * s * (1.0 - s), 1e-12);
}

TEST("e2e/gradient_descent_fits_a_line") {
    // y = 3x - 1, squared error, plain SGD on the whole batch
    const std::vector<double> xs = {-1.0, -0.5, 0.0, 0.5, 1.0, 1.5};
    double w = 0.0, b = 0.0;
    const double lr = 0.1;
    double last = 0.0;
    for (int step = 0; step < 300; ++step) {
        // node values are fixed, so each step starts from fresh leaves
        Scalar pw = parameter(w), pb = parameter(b);
        Scalar loss = constant(0.0);
        for (double xv : xs) {
            Scalar pred = sg::add(sg::mul(pw, xv), pb);
            Scalar err = sg::sub(pred, 3.0 * xv - 1.0);
            loss = sg::add(loss, sg::mul(err, err));
        }
        loss = sg::div(loss, static_cast<double>(xs.size()));
        loss.backward();
        last = loss.value();
        w -= lr * pw.grad();
        b -= lr * pb.grad();
    }
    ASSERT_NEAR(w, 3.0, 1e-3);
    ASSERT_NEAR(b, -1.0, 1e-3);
    ASSERT_TRUE(last < 1e-6);
}

TEST("e2e/batched_logistic_loss_matches_sequential") {
    const std::vector<double> xs = {-2.0, -1.0, 0.5, 2.0};
    const std::vector<double> ys = {0.0, 0.0, 1.0, 1.0};

    auto build = [&](Scalar w, Scalar b) {
        std::vector<Scalar> losses;
        for (std::size_t i = 0; i < xs.size(); ++i) {
            Scalar p = sg::sigmoid(sg::add(sg::mul(w, xs[i]), b));
            Scalar q = ys[i] > 0.5 ? p : sg::sub(1.0, p);
            losses.push_back(sg::neg(sg::logv(q)));
        }
        return losses;
    };

    Scalar w1 = parameter(0.3), b1 = parameter(-0.2);
    for (auto& l : build(w1, b1)) l.backward();

    Scalar w2 = parameter(0.3), b2 = parameter(-0.2);
    sg::backward_batch(build(w2, b2));

    ASSERT_NEAR(w1.grad(), w2.grad(), 1e-12);
    ASSERT_NEAR(b1.grad(), b2.grad(), 1e-12);
}
