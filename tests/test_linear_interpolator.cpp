#include "quadinterp/math/linear_interpolator.hpp"
#include "test_utils.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using quadinterp::math::Extrapolation;
using quadinterp::math::LinearInterpolator;
using namespace quadinterp_test;

int main() {
    LinearInterpolator linear(quadinterp::referenceSamples());

    // Passes through the samples
    expectNear(linear.interpolate(94.0), 929.0, 1e-9, "linear at 94");
    expectNear(linear.interpolate(205.0), 902.0, 1e-9, "linear at 205");
    expectNear(linear.interpolate(371.0), 860.0, 1e-9, "linear at 371");

    // 902 + 46 * (-42) / 166
    expectNear(linear.interpolate(251.0), 890.3614457831326, 1e-9, "linear at 251");
    expectNear(linear.interpolate(149.5), 915.5, 1e-9, "midpoint of first segment");

    // Clamped outside the range
    expectTrue(linear.interpolate(0.0) == 929.0, "clamped below range");
    expectTrue(linear.interpolate(93.999) == 929.0, "clamped just below range");
    expectTrue(linear.interpolate(500.0) == 860.0, "clamped above range");
    expectNear(linear.derivative(0.0), 0.0, 0., "flat slope below range");
    expectNear(linear.derivative(251.0), -42.0 / 166.0, 1e-12, "slope of second segment");

    // Batch evaluation
    Eigen::VectorXd xs(4);
    xs << 50.0, 94.0, 251.0, 400.0;
    Eigen::VectorXd ys = linear.interpolate(xs);
    expectTrue(ys.size() == 4, "batch size");
    expectNear(ys[0], 929.0, 0., "batch clamped low");
    expectNear(ys[2], 890.3614457831326, 1e-9, "batch at 251");
    expectNear(ys[3], 860.0, 0., "batch clamped high");

    // Primitive of the interpolant
    expectNear(linear.primitive(94.0), 0.0, 0., "primitive at start");
    expectNear(linear.primitive(205.0), 101620.5, 1e-6, "area of first segment");
    expectNear(linear.primitive(251.0), 142844.81325301205, 1e-6, "primitive at 251");
    expectNear(linear.primitive(84.0), -9290.0, 1e-9, "clamped primitive below range");
    expectNear(linear.primitive(381.0) - linear.primitive(371.0), 8600.0, 1e-6,
               "clamped primitive above range");

    // Linear extrapolation continues the end segments
    LinearInterpolator extrapolating({0.0, 1.0, 3.0, 4.0}, {10.0, 20.0, 25.0, 40.0},
                                     Extrapolation::Linear);
    expectNear(extrapolating.interpolate(0.8), 18.0, 1e-12, "value at 0.8");
    expectNear(extrapolating.interpolate(3.5), 32.5, 1e-12, "value at 3.5");
    expectNear(extrapolating.primitive(3.5), 74.375, 1e-12, "primitive at 3.5");
    expectNear(extrapolating.primitive(2.0), 36.25, 1e-12, "primitive at 2.0");
    expectNear(extrapolating.interpolate(-1.0), 0.0, 1e-12, "extrapolated below");
    expectNear(extrapolating.interpolate(5.0), 55.0, 1e-12, "extrapolated above");

    // Throwing mode
    LinearInterpolator strict(quadinterp::referenceSamples(), Extrapolation::Throw);
    expectNear(strict.interpolate(371.0), 860.0, 1e-9, "strict at upper end");
    expectThrows<std::out_of_range>([&strict] { strict.interpolate(93.0); },
                                    "strict below range");
    expectThrows<std::out_of_range>([&strict] { strict.primitive(372.0); },
                                    "strict primitive above range");

    // Non-finite queries: NaN propagates in every mode, infinity clamps
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    expectTrue(std::isnan(linear.interpolate(nan)), "NaN query gives NaN");
    expectTrue(std::isnan(linear.derivative(nan)), "NaN query gives NaN slope");
    expectTrue(std::isnan(linear.primitive(nan)), "NaN query gives NaN primitive");
    expectTrue(std::isnan(extrapolating.interpolate(nan)), "NaN query with linear extrapolation");
    expectTrue(std::isnan(extrapolating.primitive(nan)), "NaN primitive with linear extrapolation");
    expectTrue(std::isnan(strict.interpolate(nan)), "NaN query in strict mode");
    expectTrue(std::isnan(strict.derivative(nan)), "NaN slope in strict mode");
    expectNear(linear.interpolate(inf), 860.0, 0., "+inf clamps to last sample");
    expectNear(linear.interpolate(-inf), 929.0, 0., "-inf clamps to first sample");
    expectNear(linear.derivative(inf), 0.0, 0., "flat slope at +inf");
    expectThrows<std::out_of_range>([&strict, inf] { strict.interpolate(inf); },
                                    "strict rejects +inf");

    Eigen::VectorXd with_nan(3);
    with_nan << 100.0, nan, 300.0;
    Eigen::VectorXd nan_batch = linear.interpolate(with_nan);
    expectTrue(std::isnan(nan_batch[1]), "NaN entry of a batch stays NaN");
    expectNear(nan_batch[2], linear.interpolate(300.0), 0., "batch entry after NaN");

    expectThrows<std::invalid_argument>(
        [] { LinearInterpolator bad({1.0, 0.5}, {0.0, 1.0}); },
        "non-increasing x rejected");

    return report("test_linear_interpolator");
}
