#pragma once

#include "quadinterp/sample_set.hpp"
#include "quadinterp/general/clock.hpp"
#include "quadinterp/math/adaptive_quadrature.hpp"

namespace quadinterp {

/**
 * @brief Inputs of one evaluation run
 *
 * Defaults reproduce the reference run: samples (94, 929), (205, 902),
 * (371, 860), query point 251 and integration bounds [94, 251].
 */
struct EvaluationRequest {
  SampleSet samples = referenceSamples();
  double query = 251.0;
  double lower = 94.0;
  double upper = 251.0;
  math::QuadratureOptions quadrature;
};

struct EvaluationReport {
  double linear_value = 0.;
  math::QuadratureResult quadrature;
  // closed-form quadratic for 3 samples, barycentric Lagrange otherwise
  double polynomial_value = 0.;
  // integral of the linear interpolant from its primitive, for comparison
  double exact_integral = 0.;

  // stage timings in ms
  double linear_ms = 0.;
  double quadrature_ms = 0.;
  double polynomial_ms = 0.;
};

/**
 * @brief Interpolation & quadrature evaluator
 *
 * Runs, in order:
 * 1. piecewise-linear interpolation at the query point (clamped outside
 *    the sample range)
 * 2. adaptive quadrature of the linear interpolant between the bounds,
 *    split at the sample x values
 * 3. Lagrange polynomial through all samples at the query point
 */
class InterpEvaluator {
 public:
  InterpEvaluator() {}
  ~InterpEvaluator() {}

  /**
   * @brief Main evaluation method
   *
   * @param request Samples, query point, bounds and quadrature options
   * @param report Output, only written on success
   * @return true if every stage succeeded, false otherwise (including a
   *         non-finite query point)
   */
  bool evaluate(const EvaluationRequest& request, EvaluationReport* report);

 private:
  void evaluateLinear(const EvaluationRequest& request, EvaluationReport& report);
  void evaluateQuadrature(const EvaluationRequest& request, EvaluationReport& report);
  void evaluatePolynomial(const EvaluationRequest& request, EvaluationReport& report);

  general::Clock clock_;
};

}  // namespace quadinterp
