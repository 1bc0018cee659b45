#include "quadinterp/math/linear_interpolator.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>

namespace quadinterp {
namespace math {

LinearInterpolator::LinearInterpolator(const SampleSet& samples, Extrapolation mode)
    : x_values_(samples.x()), y_values_(samples.y()), mode_(mode) {
  update();
}

LinearInterpolator::LinearInterpolator(const std::vector<double>& x,
                                       const std::vector<double>& y,
                                       Extrapolation mode)
    : LinearInterpolator(SampleSet(x, y), mode) {}

void LinearInterpolator::update() {
  std::size_t n = x_values_.size();
  slopes_.assign(n - 1, 0.);
  primitive_const_.assign(n, 0.);

  for (std::size_t i = 1; i < n; ++i) {
    double dx = x_values_[i] - x_values_[i - 1];
    slopes_[i - 1] = (y_values_[i] - y_values_[i - 1]) / dx;
    // trapezoid area of segment i-1
    primitive_const_[i] =
        primitive_const_[i - 1] + dx * (y_values_[i - 1] + 0.5 * dx * slopes_[i - 1]);
  }
}

void LinearInterpolator::checkRange(double x) const {
  if (mode_ != Extrapolation::Throw) {
    return;
  }
  if (x < x_values_.front() || x > x_values_.back()) {
    throw std::out_of_range(
        "x value outside interpolation range x = " + std::to_string(x) +
        " x_values_.front() = " + std::to_string(x_values_.front()) +
        " x_values_.back() = " + std::to_string(x_values_.back()));
  }
}

std::size_t LinearInterpolator::locate(double x) const {
  if (x <= x_values_.front()) {
    return 0;
  }
  if (x >= x_values_.back()) {
    return x_values_.size() - 2;
  }
  // Find the right interval using binary search
  auto it = std::upper_bound(x_values_.begin(), x_values_.end(), x);
  return static_cast<std::size_t>(std::distance(x_values_.begin(), it)) - 1;
}

double LinearInterpolator::interpolate(double x) const {
  // NaN compares false against every knot and has no segment
  if (std::isnan(x)) {
    return x;
  }
  checkRange(x);

  if (mode_ == Extrapolation::Clamp) {
    if (x <= x_values_.front()) {
      return y_values_.front();
    }
    if (x >= x_values_.back()) {
      return y_values_.back();
    }
  }

  std::size_t left_idx = locate(x);
  std::size_t right_idx = left_idx + 1;

  // Linear interpolation formula: y = y1 + (x - x1) * (y2 - y1) / (x2 - x1)
  double x1 = x_values_[left_idx];
  double x2 = x_values_[right_idx];
  double y1 = y_values_[left_idx];
  double y2 = y_values_[right_idx];

  return y1 + (x - x1) * (y2 - y1) / (x2 - x1);
}

Eigen::VectorXd LinearInterpolator::interpolate(const Eigen::VectorXd& xs) const {
  Eigen::VectorXd ys(xs.size());
  for (Eigen::Index i = 0; i < xs.size(); ++i) {
    ys[i] = interpolate(xs[i]);
  }
  return ys;
}

double LinearInterpolator::derivative(double x) const {
  if (std::isnan(x)) {
    return x;
  }
  checkRange(x);
  if (mode_ == Extrapolation::Clamp &&
      (x < x_values_.front() || x > x_values_.back())) {
    return 0.;
  }
  return slopes_[locate(x)];
}

double LinearInterpolator::primitive(double x) const {
  if (std::isnan(x)) {
    return x;
  }
  checkRange(x);

  if (mode_ == Extrapolation::Clamp) {
    if (x < x_values_.front()) {
      return (x - x_values_.front()) * y_values_.front();
    }
    if (x > x_values_.back()) {
      return primitive_const_.back() + (x - x_values_.back()) * y_values_.back();
    }
  }

  std::size_t i = locate(x);
  double dx = x - x_values_[i];
  return primitive_const_[i] + dx * (y_values_[i] + 0.5 * dx * slopes_[i]);
}

}  // namespace math
}  // namespace quadinterp
