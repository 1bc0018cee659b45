#pragma once

#include <cstddef>
#include <vector>

namespace quadinterp {

/**
 * @brief Immutable ordered set of (x, y) samples
 *
 * Invariants checked on construction: same number of x and y values, at
 * least 2 points, finite values, x strictly increasing.
 */
class SampleSet {
 public:
  /**
   * @param x Sample abscissae (strictly increasing)
   * @param y Sample ordinates (same size as x)
   * @throws std::invalid_argument if an invariant does not hold
   */
  SampleSet(const std::vector<double>& x, const std::vector<double>& y);

  const std::vector<double>& x() const { return x_; }
  const std::vector<double>& y() const { return y_; }

  std::size_t size() const { return x_.size(); }
  double getMinX() const { return x_.front(); }
  double getMaxX() const { return x_.back(); }
  double getMinY() const;
  double getMaxY() const;

  // x values strictly inside (lo, hi), in increasing order
  std::vector<double> interiorKnots(double lo, double hi) const;

 private:
  void validate() const;

  std::vector<double> x_;
  std::vector<double> y_;
};

/**
 * @brief Dataset of the reference run: (94, 929), (205, 902), (371, 860)
 */
SampleSet referenceSamples();

}  // namespace quadinterp
