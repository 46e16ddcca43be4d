#include "gacha_core/stats.hpp"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

namespace gacha_core {

double percentile_sorted(const std::vector<double> &sorted, double q) {
  const std::size_t n = sorted.size();
  if (n == 0)
    return 0.0;
  if (n == 1 || q <= 0.0)
    return sorted.front();
  if (q >= 1.0)
    return sorted.back();
  const double pos = q * static_cast<double>(n - 1);
  const std::size_t i = static_cast<std::size_t>(std::floor(pos));
  const double f = pos - static_cast<double>(i);
  if (i + 1 >= n)
    return sorted[i];
  return sorted[i] * (1.0 - f) + sorted[i + 1] * f;
}

Stats compute_stats(const std::vector<int> &samples) {
  Stats st;
  const Eigen::Index n = static_cast<Eigen::Index>(samples.size());
  if (n == 0)
    return st;

  const Eigen::VectorXd v =
      Eigen::Map<const Eigen::VectorXi>(samples.data(), n).cast<double>();
  st.mean = v.mean();
  st.var = (v.array() - st.mean).square().mean();
  st.stddev = std::sqrt(st.var);

  std::vector<double> sorted(v.data(), v.data() + v.size());
  std::sort(sorted.begin(), sorted.end());
  st.p50 = percentile_sorted(sorted, 0.50);
  st.p90 = percentile_sorted(sorted, 0.90);
  st.p99 = percentile_sorted(sorted, 0.99);
  st.samples = samples;
  return st;
}

} // namespace gacha_core
