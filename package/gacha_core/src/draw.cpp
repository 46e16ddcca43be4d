#include "gacha_core/draw.hpp"
#include "gacha_core/errors.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

namespace gacha_core {

void validate_probability(double p) {
  if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
    throw InvalidProbability(
        fmt::format("invalid probability {}; must be in [0, 1]", p));
  }
}

bool draw(double p, RandomSource &source) {
  validate_probability(p);
  if (p <= 0.0)
    return false;
  if (p >= 1.0)
    return true;
  return source.next() < p;
}

bool draw(double p, const std::shared_ptr<RandomSource> &source) {
  if (!source) {
    return draw(p, *default_random_source());
  }
  return draw(p, *source);
}

std::vector<bool> draw_n(double p, int n,
                         const std::shared_ptr<RandomSource> &source) {
  if (n <= 0) {
    throw std::invalid_argument(
        fmt::format("draw_n: n must be positive, got {}", n));
  }
  const std::shared_ptr<RandomSource> src =
      source ? source : default_random_source();
  std::vector<bool> hits(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    hits[static_cast<std::size_t>(i)] = draw(p, *src);
  }
  return hits;
}

} // namespace gacha_core
