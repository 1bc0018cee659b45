#pragma once

#include <Eigen/Dense>
#include <iostream>
#include <vector>

#include "quadinterp/general/clock.hpp"
#include "quadinterp/interp_evaluator.hpp"
#include "quadinterp/math/linear_interpolator.hpp"
#include "quadinterp/sample_set.hpp"

namespace quadinterp {
inline void vectorToEigen(const std::vector<double>& vec, Eigen::VectorXd& eigen_vec) {
  eigen_vec = Eigen::Map<const Eigen::VectorXd>(vec.data(), vec.size());
}

inline void eigenToVector(const Eigen::VectorXd& eigen_vec, std::vector<double>& vec) {
  vec.resize(eigen_vec.size());
  for (int i = 0; i < eigen_vec.size(); i++) {
    vec[i] = eigen_vec[i];
  }
}

/**
 * @brief Class containing the samples, query point and integration bounds
 */
class InputData {
 public:
  InputData(std::vector<double> x_values, std::vector<double> y_values,
            double query, double lower, double upper,
            std::vector<double> query_points = std::vector<double>())
      : x_values(x_values),
        y_values(y_values),
        query(query),
        lower(lower),
        upper(upper),
        query_points(query_points) {}

  // samples
  std::vector<double> x_values;
  std::vector<double> y_values;

  // evaluation point and integration bounds
  double query;
  double lower;
  double upper;

  // extra points for the batch linear evaluation
  std::vector<double> query_points;

  // quadrature settings
  unsigned max_depth = 15;
  double tolerance = 1.49e-8;

  // Convert to EvaluationRequest format used internally
  EvaluationRequest toEvaluationRequest() const {
    EvaluationRequest request;
    request.samples = SampleSet(x_values, y_values);
    request.query = query;
    request.lower = lower;
    request.upper = upper;
    request.quadrature.max_depth = max_depth;
    request.quadrature.tolerance = tolerance;
    return request;
  }
};

/**
 * @brief Class containing the results of one evaluation
 */
class OutputData {
 public:
  OutputData() = default;
  bool success = false;
  double linear_value = 0.;
  double quadrature_estimate = 0.;
  double error_estimate = 0.;
  double quadratic_value = 0.;
  double exact_integral = 0.;
  std::vector<double> linear_values;
};

/**
 * @brief Main class for interpolating and integrating a sample set
 */
class InterpQuadEvaluation {
 public:
  InterpQuadEvaluation() = default;

  /**
   * @brief Evaluate both interpolants and the integral
   *
   * @param input_data Samples, query point and bounds
   * @return results, success == false if the input was rejected
   */
  OutputData solve(const InputData& input_data) {
    general::Clock clock;
    clock.start();
    OutputData output_data;

    EvaluationRequest request;
    try {
      request = input_data.toEvaluationRequest();
    } catch (const std::exception& e) {
      std::cerr << "InterpQuadEvaluation::solve invalid input: " << e.what()
                << std::endl;
      return output_data;
    }

    EvaluationReport report;
    InterpEvaluator evaluator;
    if (!evaluator.evaluate(request, &report)) {
      return output_data;
    }

    if (!input_data.query_points.empty()) {
      math::LinearInterpolator linear(request.samples);
      Eigen::VectorXd queries;
      vectorToEigen(input_data.query_points, queries);
      eigenToVector(linear.interpolate(queries), output_data.linear_values);
    }

    output_data.linear_value = report.linear_value;
    output_data.quadrature_estimate = report.quadrature.estimate;
    output_data.error_estimate = report.quadrature.error_estimate;
    output_data.quadratic_value = report.polynomial_value;
    output_data.exact_integral = report.exact_integral;
    output_data.success = true;
    elapsed_ms_ = clock.stop();
    return output_data;
  }

  double getElapsedMs() const { return elapsed_ms_; }

 private:
  double elapsed_ms_ = 0.;
};

}  // namespace quadinterp
