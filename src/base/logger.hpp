

#ifndef SAFEMATH_LOGGER_HPP
#define SAFEMATH_LOGGER_HPP

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace safemath::base {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @param basepath - when not empty, log to this file instead of stdout
   * @return logger object
   */
  Logger createLogger(const std::string &tag, const std::string &basepath = "");

  /**
   * Change verbosity of an already registered logger
   * @param tag - tagging name of the logger
   * @param level - minimal level that will be emitted
   */
  void setLogLevel(const std::string &tag, spdlog::level::level_enum level);
}  // namespace safemath::base

#endif  // SAFEMATH_LOGGER_HPP
