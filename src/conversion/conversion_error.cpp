

#include "conversion/conversion_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(safemath, ConversionError, e) {
  using safemath::ConversionError;
  switch (e) {
    case ConversionError::NULL_INPUT:
      return "integer value is nil";
    case ConversionError::NEGATIVE_INPUT:
      return "negative input not allowed";
    case ConversionError::PRECISION_LOSS:
      return "precision loss in conversion";
    case ConversionError::INVALID_TEXT:
      return "invalid string for big integer";
    case ConversionError::OUT_OF_RANGE:
      return "value does not fit the requested integer type";
  }
  return "unknown ConversionError";
}
