#pragma once

#include <cstddef>
#include <vector>
#include <stdexcept>

#include <Eigen/Dense>

#include "quadinterp/sample_set.hpp"

namespace quadinterp {
namespace math {

/**
 * @brief Behaviour of an interpolator outside [getMinX(), getMaxX()]
 */
enum class Extrapolation {
  Clamp,   // return the nearest endpoint's y value
  Linear,  // extend the first/last segment
  Throw    // raise std::out_of_range
};

class LinearInterpolator {
public:
    /**
     * @brief Constructs a piecewise-linear interpolator over a sample set
     * @param samples Validated sample set
     * @param mode Behaviour outside the sample range
     */
    explicit LinearInterpolator(const SampleSet& samples,
                                Extrapolation mode = Extrapolation::Clamp);

    /**
     * @brief Constructs a linear interpolator from x and y data points
     * @param x Vector of x coordinates (must be strictly increasing)
     * @param y Vector of y coordinates (must be same size as x)
     * @throws std::invalid_argument if inputs are invalid
     */
    LinearInterpolator(const std::vector<double>& x, const std::vector<double>& y,
                       Extrapolation mode = Extrapolation::Clamp);

    /**
     * @brief Interpolates to find y value at given x
     * @param x The x coordinate to interpolate at
     * @return The interpolated y value, NaN for a NaN query
     * @throws std::out_of_range if x is outside the range and mode is Throw
     */
    double interpolate(double x) const;

    /**
     * @brief Interpolates every entry of xs
     */
    Eigen::VectorXd interpolate(const Eigen::VectorXd& xs) const;

    /**
     * @brief Slope of the interpolant at x (0 in the clamped region)
     */
    double derivative(double x) const;

    /**
     * @brief Exact integral of the interpolant from getMinX() to x
     *
     * Negative for x < getMinX(). Honors the extrapolation mode.
     */
    double primitive(double x) const;

    /**
     * @brief Get the minimum x value in the interpolation range
     */
    double getMinX() const { return x_values_.front(); }

    /**
     * @brief Get the maximum x value in the interpolation range
     */
    double getMaxX() const { return x_values_.back(); }

    const std::vector<double>& getKnots() const { return x_values_; }

private:
    void update();
    void checkRange(double x) const;
    // index of the left end of the segment used for x
    std::size_t locate(double x) const;

    std::vector<double> x_values_;
    std::vector<double> y_values_;
    std::vector<double> slopes_;
    std::vector<double> primitive_const_;
    Extrapolation mode_;
};

} // namespace math
} // namespace quadinterp
