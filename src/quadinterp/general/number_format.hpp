#pragma once

#include <string>
#include <utility>

namespace quadinterp {
namespace general {

/**
 * @brief Formats a double the way Python's repr() does
 *
 * Shortest digit string that reads back to the same value, fixed notation
 * for decimal exponents in [-4, 16), scientific otherwise. Integral values
 * keep a trailing ".0"; non-finite values print as nan, inf, -inf.
 */
std::string formatDouble(double value);

/**
 * @brief Formats a pair as a Python tuple, e.g. "(1.5, 2e-09)"
 */
std::string formatPair(const std::pair<double, double>& values);

}  // namespace general
}  // namespace quadinterp
