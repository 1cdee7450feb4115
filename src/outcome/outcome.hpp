

#ifndef SAFEMATH_OUTCOME_HPP
#define SAFEMATH_OUTCOME_HPP

#include <libp2p/outcome/outcome.hpp>

namespace outcome {
  using libp2p::outcome::result;
  using libp2p::outcome::success;
  using libp2p::outcome::failure;
}

#endif  // SAFEMATH_OUTCOME_HPP
