#include "gacha_core/banner.hpp"
#include "gacha_core/draw.hpp"
#include "gacha_core/pity.hpp"
#include "gacha_core/random_source.hpp"
#include "gacha_core/session.hpp"
#include "gacha_core/simulator.hpp"
#include "gacha_core/soft_pity.hpp"
#include "gacha_core/stats.hpp"
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;

// The NB_MODULE macro defines the entry point for the Python module.
NB_MODULE(gacha_core, m) {
  m.doc() = "Gacha draw mechanics (pity, soft pity, banner) and Monte Carlo "
            "simulation.";

  // Random sources
  nb::class_<gacha_core::RandomSource>(m, "RandomSource")
      .def("next", &gacha_core::RandomSource::next);
  nb::class_<gacha_core::SystemRandom, gacha_core::RandomSource>(
      m, "SystemRandom")
      .def(nb::init<>());
  nb::class_<gacha_core::SeededRandom, gacha_core::RandomSource>(
      m, "SeededRandom")
      .def(nb::init<std::uint64_t>(), nb::arg("seed"));
  m.def("default_random_source", &gacha_core::default_random_source);

  // Plain draws
  m.def("validate_probability", &gacha_core::validate_probability,
        nb::arg("p"));
  m.def(
      "draw",
      [](double p, std::shared_ptr<gacha_core::RandomSource> source) {
        return gacha_core::draw(p, source);
      },
      nb::arg("p"), nb::arg("source") = nb::none());
  m.def("draw_n", &gacha_core::draw_n, nb::arg("p"), nb::arg("n"),
        nb::arg("source") = nb::none());

  // Pity
  nb::class_<gacha_core::PitySystem>(m, "PitySystem")
      .def(nb::init<int, std::shared_ptr<gacha_core::RandomSource>>(),
           nb::arg("pity"), nb::arg("source") = nb::none())
      .def("draw", &gacha_core::PitySystem::draw, nb::arg("p"))
      .def_prop_ro("pity", &gacha_core::PitySystem::pity)
      .def_prop_rw("count", &gacha_core::PitySystem::count,
                   &gacha_core::PitySystem::set_count)
      .def("__repr__", [](const gacha_core::PitySystem &ps) {
        return fmt::format("PitySystem(pity={}, count={})", ps.pity(),
                           ps.count());
      });

  // Soft pity
  nb::enum_<gacha_core::Easing>(m, "Easing")
      .value("Linear", gacha_core::Easing::Linear)
      .value("EaseOutQuad", gacha_core::Easing::EaseOutQuad)
      .value("EaseInOutCubic", gacha_core::Easing::EaseInOutCubic);
  m.def("parse_easing", &gacha_core::parse_easing, nb::arg("name"));
  m.def("apply_easing", &gacha_core::apply_easing, nb::arg("easing"),
        nb::arg("t"));

  nb::class_<gacha_core::SoftPityConfig>(m, "SoftPityConfig")
      .def(nb::init<>())
      .def_rw("pity", &gacha_core::SoftPityConfig::pity)
      .def_rw("start_at", &gacha_core::SoftPityConfig::start_at)
      .def_rw("target_prob", &gacha_core::SoftPityConfig::target_prob)
      .def_rw("easing", &gacha_core::SoftPityConfig::easing)
      .def("__repr__", [](const gacha_core::SoftPityConfig &c) {
        return fmt::format(
            "SoftPityConfig(pity={}, start_at={}, target_prob={}, easing={})",
            c.pity, c.start_at, c.target_prob, gacha_core::easing_name(c.easing));
      });
  m.def("make_soft_pity_config", &gacha_core::make_soft_pity_config,
        nb::arg("pity"), nb::arg("start_at") = nb::none(),
        nb::arg("start_pct") = nb::none(), nb::arg("target_prob") = nb::none(),
        nb::arg("easing") = gacha_core::Easing::Linear);

  nb::class_<gacha_core::SoftPitySystem, gacha_core::PitySystem>(
      m, "SoftPitySystem")
      .def(nb::init<int, std::optional<gacha_core::SoftPityConfig>,
                    std::shared_ptr<gacha_core::RandomSource>>(),
           nb::arg("pity"), nb::arg("soft") = nb::none(),
           nb::arg("source") = nb::none())
      .def("effective_probability",
           &gacha_core::SoftPitySystem::effective_probability,
           nb::arg("p_base"))
      .def("draw", &gacha_core::SoftPitySystem::draw, nb::arg("p_base"))
      .def_prop_ro("soft", &gacha_core::SoftPitySystem::soft);

  // Banner
  nb::class_<gacha_core::BannerOutcome>(m, "BannerOutcome")
      .def(nb::init<>())
      .def_rw("hit", &gacha_core::BannerOutcome::hit)
      .def_rw("is_up", &gacha_core::BannerOutcome::is_up)
      .def_rw("count", &gacha_core::BannerOutcome::count)
      .def_rw("guaranteed_next", &gacha_core::BannerOutcome::guaranteed_next)
      .def_rw("off_streak", &gacha_core::BannerOutcome::off_streak)
      .def("__repr__", [](const gacha_core::BannerOutcome &o) {
        return fmt::format("BannerOutcome(hit={}, is_up={}, count={}, "
                           "guaranteed_next={}, off_streak={})",
                           o.hit, o.is_up, o.count, o.guaranteed_next,
                           o.off_streak);
      });

  nb::class_<gacha_core::BannerSystem>(m, "BannerSystem")
      .def(nb::init<gacha_core::SoftPitySystem, std::vector<double>, int>(),
           nb::arg("soft"), nb::arg("off_probs"), nb::arg("max_off") = 0)
      .def("draw", &gacha_core::BannerSystem::draw, nb::arg("p_base"))
      .def("current_off_prob", &gacha_core::BannerSystem::current_off_prob)
      .def_prop_ro("off_probs", &gacha_core::BannerSystem::off_probs)
      .def_prop_rw("max_off", &gacha_core::BannerSystem::max_off,
                   &gacha_core::BannerSystem::set_max_off)
      .def_prop_ro("count", &gacha_core::BannerSystem::count)
      .def_prop_ro("off_streak", &gacha_core::BannerSystem::off_streak)
      .def_prop_ro("guaranteed_next",
                   &gacha_core::BannerSystem::guaranteed_next);

  // Simulation config/result
  nb::enum_<gacha_core::TrialGoal>(m, "TrialGoal")
      .value("FirstHit", gacha_core::TrialGoal::FirstHit)
      .value("FirstUp", gacha_core::TrialGoal::FirstUp)
      .value("FixedBudget", gacha_core::TrialGoal::FixedBudget);
  m.def("parse_trial_goal", &gacha_core::parse_trial_goal, nb::arg("name"));

  nb::class_<gacha_core::SimParams>(m, "SimParams")
      .def(nb::init<>())
      .def_rw("p_base", &gacha_core::SimParams::p_base)
      .def_rw("pity", &gacha_core::SimParams::pity)
      .def_rw("start_at", &gacha_core::SimParams::start_at)
      .def_rw("start_pct", &gacha_core::SimParams::start_pct)
      .def_rw("target_prob", &gacha_core::SimParams::target_prob)
      .def_rw("easing", &gacha_core::SimParams::easing)
      .def_rw("cushion", &gacha_core::SimParams::cushion)
      .def_rw("off_probs", &gacha_core::SimParams::off_probs)
      .def_rw("max_off", &gacha_core::SimParams::max_off);

  nb::class_<gacha_core::SimBudget>(m, "SimBudget")
      .def(nb::init<>())
      .def_rw("num_draws", &gacha_core::SimBudget::num_draws);

  nb::class_<gacha_core::SimConfig>(m, "SimConfig")
      .def(nb::init<>())
      .def_rw("seed", &gacha_core::SimConfig::seed)
      .def_rw("n_threads", &gacha_core::SimConfig::n_threads)
      .def_rw("max_draws_per_trial",
              &gacha_core::SimConfig::max_draws_per_trial)
      .def_rw("verbose", &gacha_core::SimConfig::verbose);

  nb::class_<gacha_core::Stats>(m, "Stats")
      .def(nb::init<>())
      .def_rw("mean", &gacha_core::Stats::mean)
      .def_rw("var", &gacha_core::Stats::var)
      .def_rw("stddev", &gacha_core::Stats::stddev)
      .def_rw("p50", &gacha_core::Stats::p50)
      .def_rw("p90", &gacha_core::Stats::p90)
      .def_rw("p99", &gacha_core::Stats::p99)
      .def_rw("samples", &gacha_core::Stats::samples)
      .def("__repr__", [](const gacha_core::Stats &s) {
        return fmt::format("Stats(mean={}, var={}, stddev={}, p50={}, "
                           "p90={}, p99={})",
                           s.mean, s.var, s.stddev, s.p50, s.p90, s.p99);
      });
  m.def("compute_stats", &gacha_core::compute_stats, nb::arg("samples"));

  nb::class_<gacha_core::Simulator>(m, "Simulator")
      .def(nb::init<>())
      .def(nb::init<gacha_core::SimParams>(), nb::arg("params"))
      .def_prop_rw("params", &gacha_core::Simulator::params,
                   &gacha_core::Simulator::set_params)
      .def("run", &gacha_core::Simulator::run, nb::arg("goal"),
           nb::arg("trials"), nb::arg("budget") = nb::none(),
           nb::arg("cfg") = gacha_core::SimConfig{},
           nb::call_guard<nb::gil_scoped_release>());
  m.def("run_monte_carlo", &gacha_core::run_monte_carlo, nb::arg("params"),
        nb::arg("goal"), nb::arg("trials"), nb::arg("budget") = nb::none(),
        nb::arg("cfg") = gacha_core::SimConfig{},
        nb::call_guard<nb::gil_scoped_release>());

  // Sessions
  nb::class_<gacha_core::EngineSpec>(m, "EngineSpec")
      .def(nb::init<>())
      .def_rw("pity", &gacha_core::EngineSpec::pity)
      .def_rw("start_at", &gacha_core::EngineSpec::start_at)
      .def_rw("start_pct", &gacha_core::EngineSpec::start_pct)
      .def_rw("target_prob", &gacha_core::EngineSpec::target_prob)
      .def_rw("easing", &gacha_core::EngineSpec::easing)
      .def_rw("off_probs", &gacha_core::EngineSpec::off_probs)
      .def_rw("max_off", &gacha_core::EngineSpec::max_off);

  nb::class_<gacha_core::SessionDraws>(m, "SessionDraws")
      .def(nb::init<>())
      .def_rw("outcomes", &gacha_core::SessionDraws::outcomes)
      .def_rw("count", &gacha_core::SessionDraws::count)
      .def_rw("guaranteed_next", &gacha_core::SessionDraws::guaranteed_next)
      .def_rw("off_streak", &gacha_core::SessionDraws::off_streak);

  nb::class_<gacha_core::SessionStore>(m, "SessionStore")
      .def(nb::init<std::optional<std::uint64_t>>(),
           nb::arg("seed") = nb::none())
      .def("draw_n", &gacha_core::SessionStore::draw_n, nb::arg("session"),
           nb::arg("spec"), nb::arg("p"), nb::arg("n"))
      .def("reset", &gacha_core::SessionStore::reset, nb::arg("session"))
      .def("erase", &gacha_core::SessionStore::erase, nb::arg("session"))
      .def("has", &gacha_core::SessionStore::has, nb::arg("session"))
      .def("size", &gacha_core::SessionStore::size);
}
