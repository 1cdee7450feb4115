
#ifndef SAFEMATH_CONFIG_ERROR_HPP
#define SAFEMATH_CONFIG_ERROR_HPP

#include "outcome/outcome.hpp"

namespace safemath::config {

  /**
   * Codes for errors that originate in the configuration reader
   */
  enum class ConfigReaderError {
    MISSING_ENTRY = 1,
    PARSER_ERROR,
    INVALID_VALUE
  };

}

OUTCOME_HPP_DECLARE_ERROR_2(safemath::config, ConfigReaderError);

#endif  // SAFEMATH_CONFIG_ERROR_HPP
