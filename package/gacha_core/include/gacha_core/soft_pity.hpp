#pragma once

#include <memory>
#include <optional>
#include <string>

#include "gacha_core/pity.hpp"

namespace gacha_core {

// Shape of the soft-pity ramp between start_at and pity - 1.
enum class Easing : int {
  Linear = 0,
  EaseOutQuad = 1,
  EaseInOutCubic = 2,
};

// "linear" (or empty), "easeOutQuad", "easeInOutCubic".
// Throws InvalidPityConfig for anything else.
Easing parse_easing(const std::string &name);
const char *easing_name(Easing e);

// Maps progress t in [0, 1] onto the eased progress.
double apply_easing(Easing e, double t);

// Ramp before the hard pity.
// Example: pity=90, start_at=74, target_prob=0.5 -> from draw #74 up to #89
// the probability moves from p_base towards 0.5.
struct SoftPityConfig {
  int pity{0};
  int start_at{0};
  double target_prob{0.0}; // probability reached at count == pity - 1
  Easing easing{Easing::Linear};

  // Requires pity > 1, target_prob in (0, 1) and start_at < pity - 1.
  // Negative start_at is lifted to 0. Throws InvalidPityConfig otherwise.
  void normalize();

  bool operator==(const SoftPityConfig &other) const = default;
};

// Resolves a ramp from either an explicit start index or a start fraction
// of pity (start_at = ceil(start_pct * pity), capped at pity - 1).
// start_at wins when both are given. A non-finite start_pct throws
// InvalidPityConfig. Returns no ramp when the target or
// both start values are missing.
std::optional<SoftPityConfig>
make_soft_pity_config(int pity, std::optional<int> start_at,
                      std::optional<double> start_pct,
                      std::optional<double> target_prob,
                      Easing easing = Easing::Linear);

// PitySystem with an optional soft ramp. Without a ramp it behaves exactly
// like PitySystem.
class SoftPitySystem : public PitySystem {
public:
  explicit SoftPitySystem(int pity,
                          std::optional<SoftPityConfig> soft = std::nullopt,
                          std::shared_ptr<RandomSource> source = nullptr);

  // Probability used by the next draw: 1 on hard pity, the eased ramp
  // value when count >= start_at, p_base otherwise.
  double effective_probability(double p_base) const;

  bool draw(double p_base) override;

  const std::optional<SoftPityConfig> &soft() const { return soft_; }

private:
  std::optional<SoftPityConfig> soft_;
};

} // namespace gacha_core
