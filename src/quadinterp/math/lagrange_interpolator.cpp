#include "quadinterp/math/lagrange_interpolator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace quadinterp {
namespace math {

LagrangeInterpolator::LagrangeInterpolator(const SampleSet& samples) {
  Eigen::Index n = static_cast<Eigen::Index>(samples.size());
  x_ = Eigen::Map<const Eigen::VectorXd>(samples.x().data(), n);
  y_ = Eigen::Map<const Eigen::VectorXd>(samples.y().data(), n);

  weights_ = Eigen::VectorXd::Ones(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    for (Eigen::Index j = 0; j < n; ++j) {
      if (i != j) {
        weights_[i] /= (x_[i] - x_[j]);
      }
    }
  }
}

Eigen::Index LagrangeInterpolator::findNode(double t) const {
  double eps = std::max(10. * std::numeric_limits<double>::epsilon() * std::fabs(t),
                        std::numeric_limits<double>::min());
  for (Eigen::Index i = 0; i < x_.size(); ++i) {
    if (std::fabs(x_[i] - t) <= eps) {
      return i;
    }
  }
  return -1;
}

double LagrangeInterpolator::interpolate(double t) const {
  Eigen::Index node = findNode(t);
  if (node >= 0) {
    return y_[node];
  }

  Eigen::VectorXd alpha = (weights_.array() / (t - x_.array())).matrix();
  return alpha.dot(y_) / alpha.sum();
}

double LagrangeInterpolator::derivative(double t) const {
  Eigen::Index node = findNode(t);
  if (node >= 0) {
    // p'(x_i) = sum_{j != i} w_j / w_i * (y_j - y_i) / (x_i - x_j)
    double p = 0.;
    for (Eigen::Index j = 0; j < x_.size(); ++j) {
      if (j != node) {
        p += weights_[j] / (x_[node] - x_[j]) * (y_[j] - y_[node]);
      }
    }
    return p / weights_[node];
  }

  Eigen::ArrayXd diff = t - x_.array();
  Eigen::ArrayXd alpha = weights_.array() / diff;
  Eigen::ArrayXd alphad = -alpha / diff;

  double n = (alpha * y_.array()).sum();
  double d = alpha.sum();
  double nd = (alphad * y_.array()).sum();
  double dd = alphad.sum();

  return (nd * d - n * dd) / (d * d);
}

}  // namespace math
}  // namespace quadinterp
