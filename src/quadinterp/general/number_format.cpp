#include "quadinterp/general/number_format.hpp"

#include <cmath>
#include <cstddef>
#include <cstdio>
#include <cstdlib>

namespace quadinterp {
namespace general {

namespace {

// Shortest "%.*e" rendering that round-trips; fills the significant digits
// (no dot) and the decimal exponent.
void shortestDigits(double value, std::string& digits, int& exponent) {
  char buf[40];
  for (int precision = 1; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, value);
    if (std::strtod(buf, nullptr) == value || precision == 17) {
      break;
    }
  }

  digits.clear();
  const char* p = buf;
  for (; *p != '\0' && *p != 'e'; ++p) {
    if (*p >= '0' && *p <= '9') {
      digits.push_back(*p);
    }
  }
  exponent = (*p == 'e') ? std::atoi(p + 1) : 0;

  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }
}

}  // namespace

std::string formatDouble(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value < 0 ? "-inf" : "inf";
  }
  if (value == 0.0) {
    return std::signbit(value) ? "-0.0" : "0.0";
  }

  std::string digits;
  int exponent = 0;
  shortestDigits(std::fabs(value), digits, exponent);

  std::string out = value < 0 ? "-" : "";
  const int ndigits = static_cast<int>(digits.size());

  if (exponent >= -4 && exponent < 16) {
    if (exponent < 0) {
      out += "0.";
      out.append(static_cast<std::size_t>(-exponent - 1), '0');
      out += digits;
    } else if (ndigits <= exponent + 1) {
      out += digits;
      out.append(static_cast<std::size_t>(exponent + 1 - ndigits), '0');
      out += ".0";
    } else {
      out += digits.substr(0, exponent + 1);
      out += ".";
      out += digits.substr(exponent + 1);
    }
    return out;
  }

  out += digits[0];
  if (ndigits > 1) {
    out += ".";
    out += digits.substr(1);
  }
  char exp_buf[8];
  std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+',
                std::abs(exponent));
  out += exp_buf;
  return out;
}

std::string formatPair(const std::pair<double, double>& values) {
  return "(" + formatDouble(values.first) + ", " + formatDouble(values.second) + ")";
}

}  // namespace general
}  // namespace quadinterp
