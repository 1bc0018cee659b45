#include "quadinterp/math/quadratic_interpolator.hpp"

#include <stdexcept>
#include <string>

namespace quadinterp {
namespace math {

QuadraticInterpolator::QuadraticInterpolator(const SampleSet& samples) {
  if (samples.size() != 3) {
    throw std::invalid_argument(
        "quadratic interpolation needs exactly 3 points got " +
        std::to_string(samples.size()));
  }
  for (int i = 0; i < 3; ++i) {
    x_[i] = samples.x()[i];
    y_[i] = samples.y()[i];
  }
  denom_[0] = (x_[0] - x_[1]) * (x_[0] - x_[2]);
  denom_[1] = (x_[1] - x_[0]) * (x_[1] - x_[2]);
  denom_[2] = (x_[2] - x_[0]) * (x_[2] - x_[1]);
}

double QuadraticInterpolator::basis(int i, double t) const {
  switch (i) {
    case 0:
      return (t - x_[1]) * (t - x_[2]) / denom_[0];
    case 1:
      return (t - x_[0]) * (t - x_[2]) / denom_[1];
    case 2:
      return (t - x_[0]) * (t - x_[1]) / denom_[2];
    default:
      throw std::out_of_range("basis index must be 0, 1 or 2 got " +
                              std::to_string(i));
  }
}

double QuadraticInterpolator::interpolate(double t) const {
  double a = y_[0] * ((t - x_[1]) * (t - x_[2])) / denom_[0];
  double b = y_[1] * ((t - x_[0]) * (t - x_[2])) / denom_[1];
  double c = y_[2] * ((t - x_[0]) * (t - x_[1])) / denom_[2];
  return a + b + c;
}

}  // namespace math
}  // namespace quadinterp
