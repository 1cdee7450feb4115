

#ifndef SAFEMATH_CONVERSION_ERROR_HPP
#define SAFEMATH_CONVERSION_ERROR_HPP

#include "outcome/outcome.hpp"

namespace safemath {
  /**
   * @brief Failures reported at the double and text boundaries
   */
  enum class ConversionError {  // 0 is reserved for success
    NULL_INPUT = 1,   ///< integer argument is absent
    NEGATIVE_INPUT,   ///< negative magnitudes never represent a balance
    PRECISION_LOSS,   ///< result cannot be represented without rounding away from the value
    INVALID_TEXT,     ///< text is neither base-10 nor 0x-prefixed base-16
    OUT_OF_RANGE      ///< value does not fit the requested machine integer
  };
}  // namespace safemath

OUTCOME_HPP_DECLARE_ERROR_2(safemath, ConversionError)

#endif  // SAFEMATH_CONVERSION_ERROR_HPP
