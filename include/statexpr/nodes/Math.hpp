#pragma once

#include <cmath>

#include "statexpr/Errors.hpp"

namespace statexpr::math {

// Division that reports a zero denominator instead of producing inf/NaN.
inline double divide(double num, double den) {
  if (den == 0.0) throw ArithmeticError("division by zero");
  return num / den;
}

// n-th root of a product, as used by the geometric means. Negative
// products are rejected.
inline double nthRoot(double product, double n) {
  if (n <= 0.0) throw ArithmeticError("root of degree zero");
  if (product < 0.0) throw ArithmeticError("geometric mean of a negative product");
  return std::pow(product, 1.0 / n);
}

} // namespace statexpr::math
