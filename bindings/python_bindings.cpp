#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "quadinterp.hpp"

#include "quadinterp/math/adaptive_quadrature.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_quadinterp, m) {
    m.doc() = "Python bindings for the quadinterp interpolation and quadrature library";

    py::class_<quadinterp::InputData>(m, "InputData")
        .def(py::init<std::vector<double>, std::vector<double>, double, double,
                      double, std::vector<double>>(),
             py::arg("x_values"),
             py::arg("y_values"),
             py::arg("query"),
             py::arg("lower"),
             py::arg("upper"),
             py::arg("query_points") = std::vector<double>())
        .def_readwrite("x_values", &quadinterp::InputData::x_values)
        .def_readwrite("y_values", &quadinterp::InputData::y_values)
        .def_readwrite("query", &quadinterp::InputData::query)
        .def_readwrite("lower", &quadinterp::InputData::lower)
        .def_readwrite("upper", &quadinterp::InputData::upper)
        .def_readwrite("query_points", &quadinterp::InputData::query_points)
        .def_readwrite("max_depth", &quadinterp::InputData::max_depth)
        .def_readwrite("tolerance", &quadinterp::InputData::tolerance);

    py::class_<quadinterp::OutputData>(m, "OutputData")
        .def(py::init<>())
        .def_readwrite("success", &quadinterp::OutputData::success)
        .def_readwrite("linear_value", &quadinterp::OutputData::linear_value)
        .def_readwrite("quadrature_estimate", &quadinterp::OutputData::quadrature_estimate)
        .def_readwrite("error_estimate", &quadinterp::OutputData::error_estimate)
        .def_readwrite("quadratic_value", &quadinterp::OutputData::quadratic_value)
        .def_readwrite("exact_integral", &quadinterp::OutputData::exact_integral)
        .def_readwrite("linear_values", &quadinterp::OutputData::linear_values);

    py::class_<quadinterp::InterpQuadEvaluation>(m, "InterpQuadEvaluation")
        .def(py::init<>())
        .def("solve", &quadinterp::InterpQuadEvaluation::solve, py::arg("input_data"))
        .def("get_elapsed_ms", &quadinterp::InterpQuadEvaluation::getElapsedMs);

    py::class_<quadinterp::math::LinearInterpolator>(m, "LinearInterpolator")
        .def(py::init<const std::vector<double>&, const std::vector<double>&>(),
             py::arg("x"), py::arg("y"))
        .def("interpolate",
             py::overload_cast<double>(&quadinterp::math::LinearInterpolator::interpolate,
                                       py::const_))
        .def("interpolate",
             py::overload_cast<const Eigen::VectorXd&>(
                 &quadinterp::math::LinearInterpolator::interpolate, py::const_))
        .def("derivative", &quadinterp::math::LinearInterpolator::derivative)
        .def("primitive", &quadinterp::math::LinearInterpolator::primitive);

    m.def("quad",
          [](const std::function<double(double)>& f, double a, double b) {
              return quadinterp::math::AdaptiveQuadrature().integrate(f, a, b).asPair();
          },
          py::arg("f"), py::arg("a"), py::arg("b"),
          "Adaptive Gauss-Kronrod integral of f over [a, b], returns (estimate, error)");
}
