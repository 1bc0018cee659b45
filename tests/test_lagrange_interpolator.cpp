#include "quadinterp/math/lagrange_interpolator.hpp"
#include "quadinterp/math/linear_interpolator.hpp"
#include "quadinterp/math/quadratic_interpolator.hpp"
#include "test_utils.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using quadinterp::SampleSet;
using quadinterp::math::LagrangeInterpolator;
using quadinterp::math::LinearInterpolator;
using quadinterp::math::QuadraticInterpolator;
using namespace quadinterp_test;

int main() {
    SampleSet samples = quadinterp::referenceSamples();
    QuadraticInterpolator quadratic(samples);
    LagrangeInterpolator lagrange(samples);

    // Exact pass-through of the closed form and barycentric form
    const double xs[] = {94.0, 205.0, 371.0};
    const double ys[] = {929.0, 902.0, 860.0};
    for (int i = 0; i < 3; ++i) {
        expectNear(quadratic.interpolate(xs[i]), ys[i], 1e-9, "quadratic through sample");
        expectNear(lagrange.interpolate(xs[i]), ys[i], 0., "barycentric through sample");
    }

    // Basis polynomials are cardinal: Li(xj) = delta_ij, sum Li(t) = 1
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            expectNear(quadratic.basis(i, xs[j]), i == j ? 1. : 0., 1e-12, "cardinal basis");
        }
    }
    expectNear(quadratic.basis(0, 251.0) + quadratic.basis(1, 251.0) + quadratic.basis(2, 251.0),
               1.0, 1e-12, "partition of unity");
    expectThrows<std::out_of_range>([&quadratic] { quadratic.basis(3, 1.0); },
                                    "basis index checked");

    double quadratic_251 = quadratic.interpolate(251.0);
    expectNear(quadratic_251, 890.5561165532459, 1e-9, "quadratic at 251");
    expectTrue(std::isfinite(quadratic_251), "quadratic at 251 is finite");

    LinearInterpolator linear(samples);
    expectTrue(std::fabs(quadratic_251 - linear.interpolate(251.0)) > 1e-3,
               "quadratic differs from linear between samples");

    // No clamping: the parabola keeps going outside the sample range
    expectTrue(quadratic.interpolate(0.0) != 929.0, "quadratic is not clamped");

    // Closed form and barycentric form agree
    const double probes[] = {-50.0, 100.0, 150.25, 251.0, 300.0, 500.0};
    for (double t : probes) {
        expectNear(lagrange.interpolate(t), quadratic.interpolate(t), 1e-9,
                   "barycentric matches closed form");
    }

    // Derivative against central differences, at and off the nodes
    const double h = 1e-3;
    const double derivative_probes[] = {94.0, 205.0, 251.0, 371.0, 400.0};
    for (double t : derivative_probes) {
        double fd = (quadratic.interpolate(t + h) - quadratic.interpolate(t - h)) / (2. * h);
        expectNear(lagrange.derivative(t), fd, 1e-6, "barycentric derivative");
    }

    // Higher degree: cubic through 4 points is reproduced exactly
    std::vector<double> cx = {-1.0, 0.5, 2.0, 3.0};
    std::vector<double> cy;
    for (double x : cx) {
        cy.push_back(x * x * x - 2. * x + 1.);
    }
    LagrangeInterpolator cubic(SampleSet(cx, cy));
    expectTrue(cubic.getWeights().size() == 4, "one weight per node");
    expectNear(cubic.interpolate(1.25), 1.25 * 1.25 * 1.25 - 2.5 + 1., 1e-12, "cubic value");
    expectNear(cubic.derivative(1.25), 3. * 1.25 * 1.25 - 2., 1e-10, "cubic derivative");
    expectNear(cubic.derivative(2.0), 3. * 4. - 2., 1e-10, "cubic derivative at node");

    // NaN queries propagate instead of snapping to a node
    const double nan = std::numeric_limits<double>::quiet_NaN();
    expectTrue(std::isnan(lagrange.interpolate(nan)), "barycentric NaN query");
    expectTrue(std::isnan(lagrange.derivative(nan)), "barycentric NaN derivative");
    expectTrue(std::isnan(quadratic.interpolate(nan)), "closed form NaN query");

    // A node at zero still snaps for queries below DBL_MIN
    LagrangeInterpolator around_zero(SampleSet({0.0, 1.0, 2.0}, {3.0, 5.0, 11.0}));
    const double subnormal = std::numeric_limits<double>::denorm_min();
    expectNear(around_zero.interpolate(subnormal), 3.0, 0., "subnormal query next to node 0");
    expectNear(around_zero.interpolate(-subnormal), 3.0, 0., "negative subnormal query");
    expectNear(around_zero.interpolate(1e-300), 3.0, 1e-12, "tiny query next to node 0");
    expectTrue(std::isfinite(around_zero.derivative(subnormal)), "finite derivative next to node 0");

    expectThrows<std::invalid_argument>(
        [&cx, &cy] { QuadraticInterpolator bad{SampleSet(cx, cy)}; },
        "closed form needs exactly 3 points");

    return report("test_lagrange_interpolator");
}
