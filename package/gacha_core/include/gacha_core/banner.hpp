#pragma once

#include <vector>

#include "gacha_core/soft_pity.hpp"

namespace gacha_core {

// Post-state snapshot of one banner draw.
struct BannerOutcome {
  bool hit{false};
  bool is_up{false};            // featured item; only meaningful when hit
  int count{0};                 // draws since last hit, after this draw
  bool guaranteed_next{false};  // next hit is forced UP
  int off_streak{0};            // consecutive off-banner hits
};

// Featured (UP) vs off-banner decision on top of soft/hard pity.
//
// - The wrapped SoftPitySystem decides whether a hit happens.
// - On a hit with guaranteed_next set: UP, guarantee cleared, streak reset.
// - Otherwise off ~ Bernoulli(off_probs[min(off_streak, size - 1)]).
//   An off hit grows off_streak; once off_streak > max_off the *next* hit
//   is guaranteed. An UP hit resets the streak.
class BannerSystem {
public:
  // Empty off_probs becomes {0.5}; entries outside (0, 1) become 0.5.
  // max_off <= 0 defaults to off_probs.size().
  BannerSystem(SoftPitySystem soft, std::vector<double> off_probs,
               int max_off = 0);

  BannerOutcome draw(double p_base);

  // Off probability for the current streak, kept strictly inside (0, 1).
  double current_off_prob() const;

  const SoftPitySystem &soft_pity() const { return soft_; }
  SoftPitySystem &soft_pity() { return soft_; }
  const std::vector<double> &off_probs() const { return off_probs_; }
  int max_off() const { return max_off_; }
  int count() const { return soft_.count(); }
  int off_streak() const { return off_streak_; }
  bool guaranteed_next() const { return guaranteed_next_; }

  // Callers may retune the threshold mid-sequence; the flip rule still
  // compares off_streak > max_off.
  void set_max_off(int max_off) { max_off_ = max_off; }

private:
  BannerOutcome snapshot_(bool hit, bool is_up) const;

  SoftPitySystem soft_;
  std::vector<double> off_probs_;
  int max_off_{0};
  int off_streak_{0};
  bool guaranteed_next_{false};
};

} // namespace gacha_core
