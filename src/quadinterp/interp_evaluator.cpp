#include "quadinterp/interp_evaluator.hpp"

#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>
#include <iostream>

#ifndef QUADINTERP_DEBUG_PRINT
#define QUADINTERP_DEBUG_PRINT 0
#endif

#define QI_DEBUG_MSG(msg) do { \
    if (QUADINTERP_DEBUG_PRINT) { \
        std::cout << msg; \
    } \
} while(0)

#include "quadinterp/math/lagrange_interpolator.hpp"
#include "quadinterp/math/linear_interpolator.hpp"
#include "quadinterp/math/quadratic_interpolator.hpp"

namespace quadinterp {

bool InterpEvaluator::evaluate(const EvaluationRequest& request,
                               EvaluationReport* report) {
  if (report == nullptr) {
    std::cerr << "InterpEvaluator::evaluate: report must not be null" << std::endl;
    return false;
  }

  EvaluationReport result;
  try {
    if (!std::isfinite(request.query)) {
      throw std::domain_error("query point must be finite got " +
                              std::to_string(request.query));
    }
    evaluateLinear(request, result);
    evaluateQuadrature(request, result);
    evaluatePolynomial(request, result);
  } catch (const std::exception& e) {
    std::cerr << "InterpEvaluator::evaluate failed: " << e.what() << std::endl;
    return false;
  }

  *report = result;
  return true;
}

void InterpEvaluator::evaluateLinear(const EvaluationRequest& request,
                                     EvaluationReport& report) {
  clock_.start();
  math::LinearInterpolator linear(request.samples);
  report.linear_value = linear.interpolate(request.query);
  report.linear_ms = clock_.stop();

  QI_DEBUG_MSG("InterpEvaluator::evaluateLinear f(" << request.query
               << ") = " << report.linear_value << " (" << report.linear_ms
               << "ms)" << std::endl);
}

void InterpEvaluator::evaluateQuadrature(const EvaluationRequest& request,
                                         EvaluationReport& report) {
  clock_.start();
  math::LinearInterpolator linear(request.samples);
  math::AdaptiveQuadrature quadrature(request.quadrature);

  // kinks of the interpolant sit on the knots
  std::vector<double> knots =
      request.samples.interiorKnots(request.lower, request.upper);
  report.quadrature = quadrature.integrate(
      [&linear](double t) { return linear.interpolate(t); }, request.lower,
      request.upper, knots);
  report.exact_integral =
      linear.primitive(request.upper) - linear.primitive(request.lower);
  report.quadrature_ms = clock_.stop();

  QI_DEBUG_MSG("InterpEvaluator::evaluateQuadrature [" << request.lower << ", "
               << request.upper << "] " << knots.size() << " breakpoints, estimate = "
               << report.quadrature.estimate << " +- "
               << report.quadrature.error_estimate << ", exact = "
               << report.exact_integral << " (" << report.quadrature_ms << "ms)"
               << std::endl);
}

void InterpEvaluator::evaluatePolynomial(const EvaluationRequest& request,
                                         EvaluationReport& report) {
  clock_.start();
  if (request.samples.size() == 3) {
    math::QuadraticInterpolator quadratic(request.samples);
    report.polynomial_value = quadratic.interpolate(request.query);
  } else {
    QI_DEBUG_MSG("InterpEvaluator::evaluatePolynomial " << request.samples.size()
                 << " samples, using barycentric form" << std::endl);
    math::LagrangeInterpolator lagrange(request.samples);
    report.polynomial_value = lagrange.interpolate(request.query);
  }
  report.polynomial_ms = clock_.stop();

  QI_DEBUG_MSG("InterpEvaluator::evaluatePolynomial p(" << request.query
               << ") = " << report.polynomial_value << " (" << report.polynomial_ms
               << "ms)" << std::endl);
}

}  // namespace quadinterp
