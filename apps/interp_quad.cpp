#include <iostream>

#include "quadinterp/general/number_format.hpp"
#include "quadinterp/interp_evaluator.hpp"

// Reference run over (94, 929), (205, 902), (371, 860): linear value at 251,
// its integral over [94, 251] as (estimate, error), quadratic value at 251.
int main() {
    quadinterp::EvaluationRequest request;
    quadinterp::EvaluationReport report;

    quadinterp::InterpEvaluator evaluator;
    if (!evaluator.evaluate(request, &report)) {
        std::cerr << "Failed to evaluate interpolants!" << std::endl;
        return 1;
    }

    std::cout << quadinterp::general::formatDouble(report.linear_value) << std::endl;
    std::cout << quadinterp::general::formatPair(report.quadrature.asPair()) << std::endl;
    std::cout << quadinterp::general::formatDouble(report.polynomial_value) << std::endl;

    return 0;
}
