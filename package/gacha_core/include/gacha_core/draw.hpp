#pragma once

#include <memory>
#include <vector>

#include "gacha_core/random_source.hpp"

namespace gacha_core {

// Throws InvalidProbability when p is NaN, infinite or outside [0, 1].
void validate_probability(double p);

// Single Bernoulli trial.
// p <= 0 -> false and p >= 1 -> true, both without touching the source;
// otherwise consumes exactly one value and returns source.next() < p.
bool draw(double p, RandomSource &source);

// Same as above; a null source means default_random_source().
bool draw(double p, const std::shared_ptr<RandomSource> &source);

// n plain draws at probability p (no pity, no banner).
std::vector<bool> draw_n(double p, int n,
                         const std::shared_ptr<RandomSource> &source);

} // namespace gacha_core
