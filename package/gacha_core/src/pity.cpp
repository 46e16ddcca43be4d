#include "gacha_core/pity.hpp"
#include "gacha_core/draw.hpp"

#include <algorithm>
#include <utility>

namespace gacha_core {

PitySystem::PitySystem(int pity, std::shared_ptr<RandomSource> source)
    : pity_(pity), source_(source ? std::move(source) : default_random_source()) {}

void PitySystem::set_count(int count) {
  if (!pity_enabled()) {
    count_ = 0;
    return;
  }
  count_ = std::clamp(count, 0, pity_ - 1);
}

void PitySystem::record(bool hit) {
  if (!pity_enabled())
    return;
  count_ = hit ? 0 : count_ + 1;
}

bool PitySystem::draw(double p) {
  if (hard_pity_due()) {
    count_ = 0;
    return true;
  }
  const bool hit = gacha_core::draw(p, *source_);
  record(hit);
  return hit;
}

} // namespace gacha_core
