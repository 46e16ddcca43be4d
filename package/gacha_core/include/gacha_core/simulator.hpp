#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gacha_core/banner.hpp"
#include "gacha_core/random_source.hpp"
#include "gacha_core/soft_pity.hpp"
#include "gacha_core/stats.hpp"

namespace gacha_core {

// What one trial measures.
enum class TrialGoal : int {
  FirstHit = 0,    // draws until the first hit (ignores the banner layer)
  FirstUp = 1,     // draws until the first UP; first hit without a banner
  FixedBudget = 2, // hits (or UPs with a banner) within budget.num_draws
};

// "first_hit", "first_up", "fixed_budget". Throws std::invalid_argument.
TrialGoal parse_trial_goal(const std::string &name);
const char *trial_goal_name(TrialGoal goal);

// Mechanics of one trial. A ramp is configured only when target_prob and
// one of start_at / start_pct are set; a banner only when off_probs is
// non-empty.
struct SimParams {
  double p_base{0.0};
  int pity{0};
  std::optional<int> start_at;
  std::optional<double> start_pct;
  std::optional<double> target_prob;
  Easing easing{Easing::Linear};
  int cushion{0}; // miss streak carried in from a previous pool

  std::vector<double> off_probs;
  int max_off{0}; // <= 0 defaults to off_probs.size()

  bool has_banner() const { return !off_probs.empty(); }
};

struct SimBudget {
  int num_draws{0};
};

struct SimConfig {
  // Base seed; trial k draws from SeededRandom(mix_seed(seed, k)).
  // Unset -> a base seed is taken from the default (non-reproducible) source.
  std::optional<std::uint64_t> seed;
  int n_threads{1};
  // Upper bound on draws in a first_hit / first_up trial (0 = unbounded).
  std::int64_t max_draws_per_trial{0};
  bool verbose{false};
};

// Runs the checks a trial's engine construction would; throws
// InvalidPityConfig for a ramp that cannot be built.
void validate_params(const SimParams &params);

// Fresh engines built from params. The cushion is applied to the soft pity
// count (clamped into [0, pity - 1]).
SoftPitySystem make_soft_pity(const SimParams &params,
                              std::shared_ptr<RandomSource> source);
BannerSystem make_banner(const SimParams &params,
                         std::shared_ptr<RandomSource> source);

class Simulator {
public:
  Simulator() = default;
  explicit Simulator(SimParams params) : params_(std::move(params)) {}

  void set_params(const SimParams &params) { params_ = params; }
  const SimParams &params() const { return params_; }

  // Runs `trials` independent trials; trials <= 0 gives empty Stats.
  // Bad params throw before any trial runs.
  Stats run(TrialGoal goal, int trials, const std::optional<SimBudget> &budget,
            const SimConfig &cfg = {}) const;

  // One trial on the given stream.
  int run_trial(TrialGoal goal, const std::optional<SimBudget> &budget,
                std::shared_ptr<RandomSource> source,
                std::int64_t max_draws = 0) const;

private:
  void run_block_(TrialGoal goal, const std::optional<SimBudget> &budget,
                  std::uint64_t base_seed, std::int64_t max_draws, int begin,
                  int end, std::vector<int> &samples) const;

  SimParams params_{};
};

Stats run_monte_carlo(const SimParams &params, TrialGoal goal, int trials,
                      const std::optional<SimBudget> &budget = std::nullopt,
                      const SimConfig &cfg = {});

} // namespace gacha_core
