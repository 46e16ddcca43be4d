#pragma once

#include <vector>

namespace gacha_core {

// Summary of one Monte Carlo run over integer per-trial samples.
struct Stats {
  double mean{0.0};
  double var{0.0};    // population variance
  double stddev{0.0};
  double p50{0.0};
  double p90{0.0};
  double p99{0.0};
  std::vector<int> samples; // raw per-trial values, in trial order
};

// Mean, population variance and linearly interpolated percentiles.
// Empty input gives all-zero Stats.
Stats compute_stats(const std::vector<int> &samples);

// q in [0, 1] over an ascending-sorted sample; interpolates between the
// order statistics around q * (n - 1).
double percentile_sorted(const std::vector<double> &sorted, double q);

} // namespace gacha_core
