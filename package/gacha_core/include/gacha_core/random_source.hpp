#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace gacha_core {

// Uniform generator on [0, 1). Stateful: every call advances the stream.
class RandomSource {
public:
  virtual ~RandomSource() = default;
  virtual double next() = 0;
};

// Non-reproducible source backed by the OS entropy device.
class SystemRandom : public RandomSource {
public:
  SystemRandom() = default;
  double next() override;

private:
  std::mutex mu_;
  std::random_device dev_;
};

// Reproducible source (tests, Monte Carlo).
class SeededRandom : public RandomSource {
public:
  explicit SeededRandom(std::uint64_t seed) : rng_(seed) {}
  double next() override;

private:
  std::mt19937_64 rng_;
};

// Process-wide SystemRandom shared by engines built without a source.
std::shared_ptr<RandomSource> default_random_source();

// splitmix64-style mixing to derive decorrelated per-trial seeds.
inline std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b) {
  std::uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6) + (b >> 2);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

} // namespace gacha_core
