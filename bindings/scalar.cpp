// scalar.cpp: pybind11 bindings for sg::Scalar and the primitive ops.
#include <memory>
#include <string>
#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

namespace py = pybind11;

#include "sg/all.hpp"

#ifndef SG_BINDINGS_VERSION
#define SG_BINDINGS_VERSION "0.1.0"
#endif

namespace {
// A tiny context-manager wrapper for NoGradGuard so `with scalargrad.nograd():` works
struct PyNoGradCtx {
  std::unique_ptr<sg::NoGradGuard> guard;
  PyNoGradCtx() = default;
  PyNoGradCtx& enter() { guard = std::make_unique<sg::NoGradGuard>(); return *this; }
  void exit(py::object, py::object, py::object) { guard.reset(); }
};

// Binary op taking Scalar or float on either side.
template <class F>
void def_binary(py::module_& m, const char* name, F f, const char* doc) {
  m.def(name, [f](const sg::Scalar& a, const sg::Scalar& b){ return f(a, b); }, doc, py::arg("a"), py::arg("b"));
  m.def(name, [f](const sg::Scalar& a, double b){ return f(a, sg::constant(b)); }, doc, py::arg("a"), py::arg("b"));
  m.def(name, [f](double a, const sg::Scalar& b){ return f(sg::constant(a), b); }, doc, py::arg("a"), py::arg("b"));
}

using BinFn = sg::Scalar (*)(const sg::Scalar&, const sg::Scalar&);
} // anon

PYBIND11_MODULE(scalargrad, m) {
  m.attr("__version__") = SG_BINDINGS_VERSION;

  // --- Errors ---
  py::register_exception<sg::DomainError>(m, "DomainError", PyExc_ValueError);
  py::register_exception<sg::GraphConsistencyError>(m, "GraphConsistencyError", PyExc_RuntimeError);

  // --- Grad mode ---
  m.def("is_grad_enabled", &sg::is_grad_enabled, "Return the thread's grad mode");
  m.def("set_grad_enabled", &sg::set_grad_enabled, py::arg("enabled"),
        "Enable/disable history recording for new nodes");

  py::class_<PyNoGradCtx>(m, "nograd")
      .def(py::init<>())
      .def("__enter__", &PyNoGradCtx::enter, py::return_value_policy::reference_internal)
      .def("__exit__", &PyNoGradCtx::exit);

  // --- Scalar ---
  const BinFn add = &sg::add, sub = &sg::sub, mul = &sg::mul, div = &sg::div, pw = &sg::pow;
  const BinFn lt = &sg::lt, gt = &sg::gt;

  py::class_<sg::Scalar>(m, "Scalar")
    .def(py::init<double, bool>(), py::arg("value") = 0.0, py::arg("requires_grad") = false)
    .def_property_readonly("value", &sg::Scalar::value)
    .def_property_readonly("grad", &sg::Scalar::grad)
    .def_property_readonly("requires_grad", &sg::Scalar::requires_grad)
    .def_property_readonly("unique_id", &sg::Scalar::unique_id)
    .def_property_readonly("op", [](const sg::Scalar& s){ return std::string(sg::op_name(s.op_kind())); })
    .def_property_readonly("parents", &sg::Scalar::parents)
    .def("is_leaf", &sg::Scalar::is_leaf)
    .def("is_constant", &sg::Scalar::is_constant)
    .def("zero_grad", &sg::Scalar::zero_grad)
    .def("backward", &sg::Scalar::backward, py::arg("seed") = 1.0)
    // operators; floats are wrapped with constant() explicitly
    .def("__add__",      [add](const sg::Scalar& a, const sg::Scalar& b){ return add(a, b); })
    .def("__add__",      [add](const sg::Scalar& a, double b){ return add(a, sg::constant(b)); })
    .def("__radd__",     [add](const sg::Scalar& a, double b){ return add(sg::constant(b), a); })
    .def("__sub__",      [sub](const sg::Scalar& a, const sg::Scalar& b){ return sub(a, b); })
    .def("__sub__",      [sub](const sg::Scalar& a, double b){ return sub(a, sg::constant(b)); })
    .def("__rsub__",     [sub](const sg::Scalar& a, double b){ return sub(sg::constant(b), a); })
    .def("__mul__",      [mul](const sg::Scalar& a, const sg::Scalar& b){ return mul(a, b); })
    .def("__mul__",      [mul](const sg::Scalar& a, double b){ return mul(a, sg::constant(b)); })
    .def("__rmul__",     [mul](const sg::Scalar& a, double b){ return mul(sg::constant(b), a); })
    .def("__truediv__",  [div](const sg::Scalar& a, const sg::Scalar& b){ return div(a, b); })
    .def("__truediv__",  [div](const sg::Scalar& a, double b){ return div(a, sg::constant(b)); })
    .def("__rtruediv__", [div](const sg::Scalar& a, double b){ return div(sg::constant(b), a); })
    .def("__pow__",      [pw](const sg::Scalar& a, const sg::Scalar& b){ return pw(a, b); })
    .def("__pow__",      [pw](const sg::Scalar& a, double b){ return pw(a, sg::constant(b)); })
    .def("__rpow__",     [pw](const sg::Scalar& a, double b){ return pw(sg::constant(b), a); })
    .def("__lt__",       [lt](const sg::Scalar& a, const sg::Scalar& b){ return lt(a, b); })
    .def("__lt__",       [lt](const sg::Scalar& a, double b){ return lt(a, sg::constant(b)); })
    .def("__gt__",       [gt](const sg::Scalar& a, const sg::Scalar& b){ return gt(a, b); })
    .def("__gt__",       [gt](const sg::Scalar& a, double b){ return gt(a, sg::constant(b)); })
    .def("__neg__",      [](const sg::Scalar& a){ return sg::neg(a); })
    .def("__repr__", [](const sg::Scalar& s){
      return "Scalar(value=" + std::to_string(s.value()) + ", grad=" + std::to_string(s.grad()) + ")";
    })
    ;

  // --- Leaves ---
  m.def("constant", &sg::constant, py::arg("value"));
  m.def("parameter", &sg::parameter, py::arg("value"));

  // --- Ops ---
  def_binary(m, "add", add, "Addition");
  def_binary(m, "sub", sub, "Subtraction");
  def_binary(m, "mul", mul, "Multiplication");
  def_binary(m, "div", div, "Division; raises DomainError on a zero divisor");
  def_binary(m, "pow", pw, "Power; raises DomainError outside the real domain");
  def_binary(m, "lt", lt, "1.0 if a < b else 0.0 (no gradient)");
  def_binary(m, "gt", gt, "1.0 if a > b else 0.0 (no gradient)");
  def_binary(m, "eq", static_cast<BinFn>(&sg::eq), "1.0 if a == b else 0.0 (no gradient)");

  m.def("neg", &sg::neg, py::arg("x"));
  m.def("inv", &sg::inv, py::arg("x"));
  m.def("exp", &sg::expv, py::arg("x"));
  m.def("log", &sg::logv, py::arg("x"));
  m.def("relu", &sg::relu, py::arg("x"));
  m.def("sigmoid", &sg::sigmoid, py::arg("x"));

  // --- Graph helpers ---
  m.def("stop_gradient", &sg::stop_gradient, py::arg("x"));
  m.def("detach", &sg::detach, py::arg("x"));

  // --- Backward ---
  m.def("backward_batch", &sg::backward_batch, py::arg("roots"), py::arg("seed") = 1.0,
        py::call_guard<py::gil_scoped_release>());

  // --- Numeric checks ---
  m.def("central_difference", &sg::central_difference,
        py::arg("f"), py::arg("vals"), py::arg("arg") = 0, py::arg("epsilon") = 1e-6);
}
