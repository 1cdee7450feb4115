
#include "config/safemath_config.hpp"

#include <sstream>

#include <boost/property_tree/json_parser.hpp>

#include "base/logger.hpp"
#include "config/pt_util.hpp"
#include "conversion/decimal_bridge.hpp"
#include "conversion/scale_cache.hpp"
#include "numeric/BigIntPool.hpp"

namespace safemath::config {

  namespace pt = boost::property_tree;

  namespace {
    constexpr auto kSection = "safemath";

    outcome::result<std::vector<uint64_t>> readExponents(
        const pt::ptree &section) {
      std::vector<uint64_t> exponents;
      auto node = section.get_child_optional("prewarm_exponents");
      if (! node) {
        return exponents;
      }
      for (const auto &item : *node) {
        auto exponent = item.second.get_value_optional<int64_t>();
        if (! exponent) {
          return ConfigReaderError::PARSER_ERROR;
        }
        if (exponent.value() < 0) {
          return ConfigReaderError::INVALID_VALUE;
        }
        exponents.push_back(static_cast<uint64_t>(exponent.value()));
      }
      return exponents;
    }

    outcome::result<spdlog::level::level_enum> readLogLevel(
        const pt::ptree &section, spdlog::level::level_enum fallback) {
      OUTCOME_TRY(auto &&name,
                  readOr<std::string>(section, "log_level", ""));
      if (name.empty()) {
        return fallback;
      }
      auto level = spdlog::level::from_str(name);
      // from_str maps unknown names to off
      if (level == spdlog::level::off && name != "off") {
        return ConfigReaderError::INVALID_VALUE;
      }
      return level;
    }
  }  // namespace

  outcome::result<SafeMathConfig> LoadFromTree(const pt::ptree &tree) {
    OUTCOME_TRY(auto &&section, ensure(tree.get_child_optional(kSection)));

    SafeMathConfig config;
    OUTCOME_TRY(auto &&exponents, readExponents(section));
    config.prewarm_exponents = exponents;

    OUTCOME_TRY(auto &&ratio,
                readOr<double>(section,
                               "precision_warning_ratio",
                               config.precision_warning_ratio));
    if (! (ratio > 0.0)) {
      return ConfigReaderError::INVALID_VALUE;
    }
    config.precision_warning_ratio = ratio;

    OUTCOME_TRY(auto &&capacity,
                readOr<int64_t>(section,
                                "pool_capacity",
                                static_cast<int64_t>(config.pool_capacity)));
    if (capacity < 0) {
      return ConfigReaderError::INVALID_VALUE;
    }
    config.pool_capacity = static_cast<size_t>(capacity);

    OUTCOME_TRY(auto &&level, readLogLevel(section, config.log_level));
    config.log_level = level;

    return config;
  }

  outcome::result<SafeMathConfig> LoadFromString(const std::string &text) {
    pt::ptree tree;
    try {
      std::istringstream stream(text);
      pt::read_json(stream, tree);
    } catch (const pt::json_parser_error &) {
      return ConfigReaderError::PARSER_ERROR;
    }
    return LoadFromTree(tree);
  }

  outcome::result<SafeMathConfig> LoadFromFile(const std::string &path) {
    pt::ptree tree;
    try {
      pt::read_json(path, tree);
    } catch (const pt::json_parser_error &) {
      return ConfigReaderError::PARSER_ERROR;
    }
    return LoadFromTree(tree);
  }

  void ApplyConfig(const SafeMathConfig &config) {
    auto logger = base::createLogger("SafeMath");

    ScaleCache::GetInstance().Warm(config.prewarm_exponents);
    DecimalBridge::SetPrecisionWarningRatio(config.precision_warning_ratio);
    BigIntPool::Shared().SetCapacity(config.pool_capacity);
    base::setLogLevel("SafeMath", config.log_level);

    logger->info(
        "Applied configuration: {} prewarmed exponents, warning ratio {}, "
        "pool capacity {}, log level {}",
        config.prewarm_exponents.size(),
        config.precision_warning_ratio,
        config.pool_capacity,
        spdlog::level::to_string_view(config.log_level));
  }

}  // namespace safemath::config
