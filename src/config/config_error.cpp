
#include "config/config_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(safemath::config,
                            ConfigReaderError,
                            e) {
  using E = safemath::config::ConfigReaderError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the provided config";
    case E::PARSER_ERROR:
      return "Internal parser error";
    case E::INVALID_VALUE:
      return "A config entry holds a value outside its allowed range";
  }
  return "Unknown error";
}
