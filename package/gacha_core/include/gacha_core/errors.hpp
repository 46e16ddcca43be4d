#pragma once

#include <stdexcept>
#include <string>

namespace gacha_core {

// Probability outside [0, 1], NaN or infinite.
class InvalidProbability : public std::invalid_argument {
public:
  explicit InvalidProbability(const std::string &what)
      : std::invalid_argument(what) {}
};

// Pity / soft-pity configuration that cannot produce a valid ramp.
class InvalidPityConfig : public std::invalid_argument {
public:
  explicit InvalidPityConfig(const std::string &what)
      : std::invalid_argument(what) {}
};

} // namespace gacha_core
