#include "gacha_core/soft_pity.hpp"
#include "gacha_core/draw.hpp"
#include "gacha_core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>

namespace gacha_core {

// Keeps the ramp strictly below 1 so only the hard pity can guarantee a hit.
static constexpr double kMaxRampProb = 0.999999999999;

Easing parse_easing(const std::string &name) {
  if (name.empty() || name == "linear")
    return Easing::Linear;
  if (name == "easeOutQuad")
    return Easing::EaseOutQuad;
  if (name == "easeInOutCubic")
    return Easing::EaseInOutCubic;
  throw InvalidPityConfig(fmt::format(
      "unknown easing '{}'; expected linear, easeOutQuad or easeInOutCubic",
      name));
}

const char *easing_name(Easing e) {
  switch (e) {
  case Easing::EaseOutQuad:
    return "easeOutQuad";
  case Easing::EaseInOutCubic:
    return "easeInOutCubic";
  case Easing::Linear:
  default:
    return "linear";
  }
}

double apply_easing(Easing e, double t) {
  switch (e) {
  case Easing::EaseOutQuad:
    return 1.0 - (1.0 - t) * (1.0 - t);
  case Easing::EaseInOutCubic: {
    if (t < 0.5)
      return 4.0 * t * t * t;
    const double u = -2.0 * t + 2.0;
    return 1.0 - u * u * u / 2.0;
  }
  case Easing::Linear:
  default:
    return t;
  }
}

void SoftPityConfig::normalize() {
  if (pity <= 1) {
    throw InvalidPityConfig(
        fmt::format("soft pity: pity must be > 1, got {}", pity));
  }
  if (!(target_prob > 0.0 && target_prob < 1.0)) {
    throw InvalidPityConfig(fmt::format(
        "soft pity: target_prob must be in (0, 1), got {}", target_prob));
  }
  if (start_at < 0)
    start_at = 0;
  // The ramp ends at pity - 1 and needs at least one step to get there.
  if (start_at >= pity - 1) {
    throw InvalidPityConfig(
        fmt::format("soft pity: start_at {} leaves no room to ramp before "
                    "pity {}",
                    start_at, pity));
  }
}

std::optional<SoftPityConfig>
make_soft_pity_config(int pity, std::optional<int> start_at,
                      std::optional<double> start_pct,
                      std::optional<double> target_prob, Easing easing) {
  if (!target_prob || (!start_at && !start_pct))
    return std::nullopt;

  int start = 0;
  if (start_at) {
    start = *start_at;
  } else {
    if (!std::isfinite(*start_pct)) {
      throw InvalidPityConfig(fmt::format(
          "soft pity: start_pct must be a finite fraction, got {}", *start_pct));
    }
    const double pct = std::clamp(*start_pct, 0.0, 1.0);
    start = static_cast<int>(std::ceil(pct * static_cast<double>(pity)));
    if (start >= pity)
      start = pity - 1;
  }

  SoftPityConfig cfg;
  cfg.pity = pity;
  cfg.start_at = start;
  cfg.target_prob = *target_prob;
  cfg.easing = easing;
  return cfg;
}

SoftPitySystem::SoftPitySystem(int pity, std::optional<SoftPityConfig> soft,
                               std::shared_ptr<RandomSource> source)
    : PitySystem(pity, std::move(source)), soft_(std::move(soft)) {
  if (soft_) {
    soft_->pity = pity;
    soft_->normalize();
  }
}

double SoftPitySystem::effective_probability(double p_base) const {
  if (hard_pity_due())
    return 1.0;
  if (!soft_ || count_ < soft_->start_at)
    return p_base;

  const int end = pity_ - 1;
  const double length = static_cast<double>(end - soft_->start_at);
  if (length <= 0.0)
    return p_base;
  double t = static_cast<double>(count_ - soft_->start_at) / length;
  t = std::clamp(t, 0.0, 1.0);
  t = apply_easing(soft_->easing, t);

  const double p = p_base + (soft_->target_prob - p_base) * t;
  return std::clamp(p, 0.0, kMaxRampProb);
}

bool SoftPitySystem::draw(double p_base) {
  if (hard_pity_due()) {
    count_ = 0;
    return true;
  }
  // The ramp clamps its output, so reject a bad base before it is reshaped.
  validate_probability(p_base);
  const bool hit = gacha_core::draw(effective_probability(p_base), *source_);
  record(hit);
  return hit;
}

} // namespace gacha_core
