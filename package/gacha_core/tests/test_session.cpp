#include <catch2/catch.hpp>
#include <gacha_core/errors.hpp>
#include <gacha_core/session.hpp>

#include <stdexcept>
#include <thread>
#include <vector>

using namespace gacha_core;

namespace {

EngineSpec hard_pity(int pity) {
  EngineSpec spec;
  spec.pity = pity;
  return spec;
}

} // namespace

TEST_CASE("session keeps counters across batches") {
  SessionStore store(42);
  const EngineSpec spec = hard_pity(10);

  const SessionDraws first = store.draw_n("alice", spec, 0.0, 9);
  REQUIRE(first.outcomes.size() == 9);
  for (const auto &o : first.outcomes)
    REQUIRE_FALSE(o.hit);
  REQUIRE(first.count == 9);
  REQUIRE(first.outcomes.back().count == 9);

  const SessionDraws second = store.draw_n("alice", spec, 0.0, 1);
  REQUIRE(second.outcomes.front().hit);
  REQUIRE(second.count == 0);
}

TEST_CASE("sessions are independent") {
  SessionStore store(42);
  store.draw_n("alice", hard_pity(10), 0.0, 5);
  const SessionDraws bob = store.draw_n("bob", hard_pity(10), 0.0, 1);
  REQUIRE(bob.count == 1);
  REQUIRE(store.size() == 2);
}

TEST_CASE("a different spec rebuilds the engine") {
  SessionStore store(42);
  store.draw_n("alice", hard_pity(10), 0.0, 5);
  const SessionDraws after = store.draw_n("alice", hard_pity(20), 0.0, 1);
  REQUIRE(after.count == 1);
}

TEST_CASE("an equivalent ramp keeps the counters") {
  SessionStore store(42);
  EngineSpec by_index = hard_pity(90);
  by_index.start_at = 45;
  by_index.target_prob = 0.5;
  EngineSpec by_fraction = hard_pity(90);
  by_fraction.start_pct = 0.5; // ceil(0.5 * 90) = 45
  by_fraction.target_prob = 0.5;

  store.draw_n("alice", by_index, 0.0, 5);
  REQUIRE(store.draw_n("alice", by_fraction, 0.0, 1).count == 6);

  by_fraction.easing = Easing::EaseOutQuad;
  REQUIRE(store.draw_n("alice", by_fraction, 0.0, 1).count == 1);
}

TEST_CASE("rebuilding a session keeps advancing its random stream") {
  auto hits = [](const SessionDraws &d) {
    std::vector<int> out;
    for (const auto &o : d.outcomes)
      out.push_back(o.hit ? 1 : 0);
    return out;
  };
  const EngineSpec spec = hard_pity(1000);

  SECTION("reset") {
    SessionStore store(42);
    const auto before = hits(store.draw_n("s", spec, 0.5, 32));
    REQUIRE(store.reset("s"));
    const auto after = hits(store.draw_n("s", spec, 0.5, 32));
    REQUIRE(before != after);
  }

  SECTION("spec switched away and back") {
    SessionStore store(42);
    const auto before = hits(store.draw_n("s", spec, 0.5, 32));
    store.draw_n("s", hard_pity(80), 0.0, 1);
    const auto after = hits(store.draw_n("s", spec, 0.5, 32));
    REQUIRE(before != after);
  }

  SECTION("same seed and id still reproduce the first batch") {
    SessionStore a(42);
    SessionStore b(42);
    REQUIRE(hits(a.draw_n("s", spec, 0.5, 32)) ==
            hits(b.draw_n("s", spec, 0.5, 32)));
  }
}

TEST_CASE("banner sessions report the guarantee") {
  SessionStore store(7);
  EngineSpec spec = hard_pity(90);
  spec.off_probs = {0.5};
  spec.max_off = 1;

  const SessionDraws res = store.draw_n("alice", spec, 1.0, 60);
  int offs_in_a_row = 0;
  for (const auto &o : res.outcomes) {
    REQUIRE(o.hit);
    offs_in_a_row = o.is_up ? 0 : offs_in_a_row + 1;
    REQUIRE(offs_in_a_row <= 2);
    REQUIRE(o.guaranteed_next == (o.off_streak > 1));
  }
  REQUIRE(res.off_streak == res.outcomes.back().off_streak);
  REQUIRE(res.guaranteed_next == res.outcomes.back().guaranteed_next);
}

TEST_CASE("bad requests leave the store untouched") {
  SessionStore store;

  SECTION("non-positive n") {
    REQUIRE_THROWS_AS(store.draw_n("alice", hard_pity(10), 0.5, 0),
                      std::invalid_argument);
  }

  SECTION("invalid probability") {
    REQUIRE_THROWS_AS(store.draw_n("alice", hard_pity(10), 1.5, 3),
                      InvalidProbability);
  }

  SECTION("invalid spec") {
    EngineSpec spec = hard_pity(10);
    spec.start_at = 9;
    spec.target_prob = 0.5;
    REQUIRE_THROWS_AS(store.draw_n("alice", spec, 0.5, 3), InvalidPityConfig);
  }

  REQUIRE_FALSE(store.has("alice"));
  REQUIRE(store.size() == 0);
}

TEST_CASE("reset and erase") {
  SessionStore store(1);
  REQUIRE_FALSE(store.reset("alice"));
  REQUIRE_FALSE(store.erase("alice"));

  store.draw_n("alice", hard_pity(10), 0.0, 4);
  REQUIRE(store.reset("alice"));
  REQUIRE(store.draw_n("alice", hard_pity(10), 0.0, 1).count == 1);

  REQUIRE(store.erase("alice"));
  REQUIRE_FALSE(store.has("alice"));
}

TEST_CASE("concurrent draws on one session are serialized") {
  SessionStore store;
  const EngineSpec spec = hard_pity(1000);
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&store, &spec]() {
      for (int i = 0; i < 50; ++i)
        store.draw_n("shared", spec, 0.0, 1);
    });
  }
  for (auto &th : workers)
    th.join();
  REQUIRE(store.draw_n("shared", spec, 0.0, 1).count == 201);
}
