#include "gacha_core/random_source.hpp"

namespace gacha_core {

// Top 53 bits of a 64-bit word -> double in [0, 1)
static inline double to_unit(std::uint64_t x) {
  return static_cast<double>(x >> 11) * 0x1.0p-53;
}

double SystemRandom::next() {
  std::lock_guard<std::mutex> lock(mu_);
  const std::uint64_t hi = dev_();
  const std::uint64_t lo = dev_();
  return to_unit((hi << 32) | (lo & 0xffffffffULL));
}

double SeededRandom::next() { return to_unit(rng_()); }

std::shared_ptr<RandomSource> default_random_source() {
  static const std::shared_ptr<RandomSource> src =
      std::make_shared<SystemRandom>();
  return src;
}

} // namespace gacha_core
