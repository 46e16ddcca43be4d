#include "gacha_core/banner.hpp"
#include "gacha_core/draw.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace gacha_core {

BannerSystem::BannerSystem(SoftPitySystem soft, std::vector<double> off_probs,
                           int max_off)
    : soft_(std::move(soft)), off_probs_(std::move(off_probs)),
      max_off_(max_off) {
  if (off_probs_.empty())
    off_probs_.push_back(0.5);
  for (double &p : off_probs_) {
    if (!(p > 0.0 && p < 1.0))
      p = 0.5;
  }
  if (max_off_ <= 0)
    max_off_ = static_cast<int>(off_probs_.size());
}

double BannerSystem::current_off_prob() const {
  const std::size_t last = off_probs_.size() - 1;
  const std::size_t idx =
      std::min(static_cast<std::size_t>(std::max(0, off_streak_)), last);
  double p = off_probs_[idx];
  if (p <= 0.0)
    p = std::numeric_limits<double>::denorm_min();
  if (p >= 1.0)
    p = 1.0 - 1e-12;
  return p;
}

BannerOutcome BannerSystem::snapshot_(bool hit, bool is_up) const {
  BannerOutcome out;
  out.hit = hit;
  out.is_up = is_up;
  out.count = soft_.count();
  out.guaranteed_next = guaranteed_next_;
  out.off_streak = off_streak_;
  return out;
}

BannerOutcome BannerSystem::draw(double p_base) {
  if (!soft_.draw(p_base))
    return snapshot_(false, false);

  if (guaranteed_next_) {
    guaranteed_next_ = false;
    off_streak_ = 0;
    return snapshot_(true, true);
  }

  const bool off = gacha_core::draw(current_off_prob(), *soft_.source());
  if (off) {
    ++off_streak_;
    if (off_streak_ > max_off_)
      guaranteed_next_ = true;
    return snapshot_(true, false);
  }

  off_streak_ = 0;
  guaranteed_next_ = false;
  return snapshot_(true, true);
}

} // namespace gacha_core
