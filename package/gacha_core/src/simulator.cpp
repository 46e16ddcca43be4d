#include "gacha_core/simulator.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>

namespace gacha_core {

TrialGoal parse_trial_goal(const std::string &name) {
  if (name == "first_hit")
    return TrialGoal::FirstHit;
  if (name == "first_up")
    return TrialGoal::FirstUp;
  if (name == "fixed_budget")
    return TrialGoal::FixedBudget;
  throw std::invalid_argument(fmt::format(
      "unknown goal '{}'; expected first_hit, first_up or fixed_budget", name));
}

const char *trial_goal_name(TrialGoal goal) {
  switch (goal) {
  case TrialGoal::FirstHit:
    return "first_hit";
  case TrialGoal::FirstUp:
    return "first_up";
  case TrialGoal::FixedBudget:
    return "fixed_budget";
  }
  return "unknown";
}

void validate_params(const SimParams &params) {
  std::optional<SoftPityConfig> ramp = make_soft_pity_config(
      params.pity, params.start_at, params.start_pct, params.target_prob,
      params.easing);
  if (ramp) {
    ramp->pity = params.pity;
    ramp->normalize();
  }
}

SoftPitySystem make_soft_pity(const SimParams &params,
                              std::shared_ptr<RandomSource> source) {
  SoftPitySystem sp(params.pity,
                    make_soft_pity_config(params.pity, params.start_at,
                                          params.start_pct, params.target_prob,
                                          params.easing),
                    std::move(source));
  sp.set_count(params.cushion);
  return sp;
}

BannerSystem make_banner(const SimParams &params,
                         std::shared_ptr<RandomSource> source) {
  return BannerSystem(make_soft_pity(params, std::move(source)),
                      params.off_probs, params.max_off);
}

int Simulator::run_trial(TrialGoal goal, const std::optional<SimBudget> &budget,
                         std::shared_ptr<RandomSource> source,
                         std::int64_t max_draws) const {
  std::optional<BannerSystem> banner;
  std::optional<SoftPitySystem> plain;
  if (params_.has_banner()) {
    banner.emplace(make_banner(params_, std::move(source)));
  } else {
    plain.emplace(make_soft_pity(params_, std::move(source)));
  }
  SoftPitySystem &soft = banner ? banner->soft_pity() : *plain;
  const double p = params_.p_base;

  auto check_bound = [&](std::int64_t draws) {
    if (max_draws > 0 && draws > max_draws) {
      throw std::runtime_error(fmt::format(
          "trial exceeded {} draws without reaching goal '{}'", max_draws,
          trial_goal_name(goal)));
    }
  };

  switch (goal) {
  case TrialGoal::FirstUp:
    if (banner) {
      std::int64_t draws = 0;
      while (true) {
        check_bound(++draws);
        const BannerOutcome out = banner->draw(p);
        if (out.hit && out.is_up)
          return static_cast<int>(draws);
      }
    }
    // No banner: first UP is the first hit.
    [[fallthrough]];
  case TrialGoal::FirstHit: {
    std::int64_t draws = 0;
    while (true) {
      check_bound(++draws);
      if (soft.draw(p))
        return static_cast<int>(draws);
    }
  }
  case TrialGoal::FixedBudget: {
    if (!budget || budget->num_draws <= 0)
      return 0;
    int count = 0;
    for (int i = 0; i < budget->num_draws; ++i) {
      if (banner) {
        const BannerOutcome out = banner->draw(p);
        if (out.hit && out.is_up)
          ++count;
      } else if (soft.draw(p)) {
        ++count;
      }
    }
    return count;
  }
  }
  return 0;
}

void Simulator::run_block_(TrialGoal goal,
                           const std::optional<SimBudget> &budget,
                           std::uint64_t base_seed, std::int64_t max_draws,
                           int begin, int end,
                           std::vector<int> &samples) const {
  for (int k = begin; k < end; ++k) {
    auto src = std::make_shared<SeededRandom>(
        mix_seed(base_seed, static_cast<std::uint64_t>(k)));
    samples[static_cast<std::size_t>(k)] =
        run_trial(goal, budget, std::move(src), max_draws);
  }
}

Stats Simulator::run(TrialGoal goal, int trials,
                     const std::optional<SimBudget> &budget,
                     const SimConfig &cfg) const {
  if (trials <= 0)
    return Stats{};

  // Surface config errors before spawning anything.
  validate_params(params_);

  std::uint64_t base_seed = 0;
  if (cfg.seed) {
    base_seed = *cfg.seed;
  } else {
    base_seed =
        static_cast<std::uint64_t>(default_random_source()->next() * 0x1.0p53);
  }
  const int n_threads = std::clamp(cfg.n_threads, 1, trials);

  if (cfg.verbose) {
    std::cout << "[Debug] monte carlo: trials=" << trials
              << " goal=" << trial_goal_name(goal) << " threads=" << n_threads
              << " seed=" << base_seed << std::endl;
  }

  std::vector<int> samples(static_cast<std::size_t>(trials), 0);
  if (n_threads == 1) {
    run_block_(goal, budget, base_seed, cfg.max_draws_per_trial, 0, trials,
               samples);
  } else {
    std::vector<std::thread> workers;
    std::vector<std::exception_ptr> errors(static_cast<std::size_t>(n_threads));
    workers.reserve(static_cast<std::size_t>(n_threads));
    const int per = trials / n_threads;
    const int extra = trials % n_threads;
    int begin = 0;
    for (int w = 0; w < n_threads; ++w) {
      const int end = begin + per + (w < extra ? 1 : 0);
      workers.emplace_back([&, w, begin, end]() {
        try {
          run_block_(goal, budget, base_seed, cfg.max_draws_per_trial, begin,
                     end, samples);
        } catch (...) {
          errors[static_cast<std::size_t>(w)] = std::current_exception();
        }
      });
      begin = end;
    }
    for (auto &th : workers)
      th.join();
    for (const auto &err : errors) {
      if (err)
        std::rethrow_exception(err);
    }
  }

  Stats st = compute_stats(samples);
  if (cfg.verbose) {
    std::cout << "[Debug] monte carlo: mean=" << st.mean
              << " stddev=" << st.stddev << " p50=" << st.p50
              << " p90=" << st.p90 << " p99=" << st.p99 << std::endl;
  }
  return st;
}

Stats run_monte_carlo(const SimParams &params, TrialGoal goal, int trials,
                      const std::optional<SimBudget> &budget,
                      const SimConfig &cfg) {
  return Simulator(params).run(goal, trials, budget, cfg);
}

} // namespace gacha_core
