
#ifndef SAFEMATH_CONFIG_SAFEMATH_CONFIG_HPP
#define SAFEMATH_CONFIG_SAFEMATH_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>
#include <spdlog/common.h>

#include "config/config_error.hpp"

namespace safemath::config {

  /**
   * Tunables of the conversion engine, read from the "safemath" section
   * of a JSON document
   */
  struct SafeMathConfig {
    std::vector<uint64_t> prewarm_exponents;
    double precision_warning_ratio = 0.001;
    size_t pool_capacity = 1024;
    spdlog::level::level_enum log_level = spdlog::level::info;
  };

  /**
   * Load configuration from a JSON file
   * @param path - file to read
   * @return parsed configuration or ConfigReaderError
   */
  outcome::result<SafeMathConfig> LoadFromFile(const std::string &path);

  /**
   * Load configuration from JSON text
   */
  outcome::result<SafeMathConfig> LoadFromString(const std::string &text);

  /**
   * Build configuration from an already parsed tree
   */
  outcome::result<SafeMathConfig> LoadFromTree(
      const boost::property_tree::ptree &tree);

  /**
   * Push configuration into the process-wide cache, pool, bridge and logger
   */
  void ApplyConfig(const SafeMathConfig &config);

}  // namespace safemath::config

#endif  // SAFEMATH_CONFIG_SAFEMATH_CONFIG_HPP
