
#ifndef SAFEMATH_CONFIG_PT_UTIL_HPP
#define SAFEMATH_CONFIG_PT_UTIL_HPP

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include "config/config_error.hpp"

namespace safemath::config {

  template <typename T>
  outcome::result<std::decay_t<T>> ensure(boost::optional<T> opt_entry) {
    if (! opt_entry) {
      return ConfigReaderError::MISSING_ENTRY;
    }
    return opt_entry.value();
  }

  /**
   * Read an optional typed entry; an entry that is present but does not
   * convert to T is a parser error, an absent one keeps @param fallback
   */
  template <typename T>
  outcome::result<T> readOr(const boost::property_tree::ptree &tree,
                            const std::string &path,
                            T fallback) {
    auto node = tree.get_child_optional(path);
    if (! node) {
      return fallback;
    }
    auto value = node->get_value_optional<T>();
    if (! value) {
      return ConfigReaderError::PARSER_ERROR;
    }
    return value.value();
  }

}  // namespace safemath::config

#endif  // SAFEMATH_CONFIG_PT_UTIL_HPP
