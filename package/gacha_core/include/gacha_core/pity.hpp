#pragma once

#include <memory>

#include "gacha_core/random_source.hpp"

namespace gacha_core {

// Hard pity: once `pity - 1` consecutive misses have accumulated, the next
// draw is a guaranteed hit. A non-positive threshold disables pity and every
// call degrades to a plain draw.
class PitySystem {
public:
  explicit PitySystem(int pity, std::shared_ptr<RandomSource> source = nullptr);
  virtual ~PitySystem() = default;

  // On hit the miss streak resets to 0, otherwise it grows by one.
  virtual bool draw(double p);

  int pity() const { return pity_; }
  bool pity_enabled() const { return pity_ > 0; }

  // Draws since the last hit.
  int count() const { return count_; }
  // Carry-over miss streak; clamped into [0, pity - 1].
  void set_count(int count);

  const std::shared_ptr<RandomSource> &source() const { return source_; }

protected:
  bool hard_pity_due() const { return pity_ > 0 && count_ + 1 >= pity_; }
  void record(bool hit);

  int pity_{0};
  int count_{0};
  std::shared_ptr<RandomSource> source_;
};

} // namespace gacha_core
