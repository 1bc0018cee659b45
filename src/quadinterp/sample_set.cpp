#include "quadinterp/sample_set.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace quadinterp {

SampleSet::SampleSet(const std::vector<double>& x, const std::vector<double>& y)
    : x_(x), y_(y) {
  validate();
}

void SampleSet::validate() const {
  if (x_.size() != y_.size()) {
    throw std::invalid_argument(
        "x and y vectors must have the same size got x.size() = " +
        std::to_string(x_.size()) + " and y.size() = " + std::to_string(y_.size()));
  }
  if (x_.size() < 2) {
    throw std::invalid_argument("Need at least 2 points for interpolation");
  }

  for (std::size_t i = 0; i < x_.size(); ++i) {
    if (!std::isfinite(x_[i]) || !std::isfinite(y_[i])) {
      throw std::invalid_argument(
          "sample values must be finite got x[" + std::to_string(i) +
          "] = " + std::to_string(x_[i]) + " and y[" + std::to_string(i) +
          "] = " + std::to_string(y_[i]));
    }
  }

  // Verify x is strictly increasing
  for (std::size_t i = 1; i < x_.size(); ++i) {
    if (x_[i] <= x_[i - 1]) {
      throw std::invalid_argument(
          "x values must be strictly increasing got x[i] = " + std::to_string(x_[i]) +
          " and x[i-1] = " + std::to_string(x_[i - 1]));
    }
  }
}

double SampleSet::getMinY() const {
  return *std::min_element(y_.begin(), y_.end());
}

double SampleSet::getMaxY() const {
  return *std::max_element(y_.begin(), y_.end());
}

std::vector<double> SampleSet::interiorKnots(double lo, double hi) const {
  if (hi < lo) {
    std::swap(lo, hi);
  }
  auto first = std::upper_bound(x_.begin(), x_.end(), lo);
  auto last = std::lower_bound(x_.begin(), x_.end(), hi);
  if (first >= last) {
    return std::vector<double>();
  }
  return std::vector<double>(first, last);
}

SampleSet referenceSamples() {
  return SampleSet({94.0, 205.0, 371.0}, {929.0, 902.0, 860.0});
}

}  // namespace quadinterp
