#include <catch2/catch.hpp>
#include <gacha_core/banner.hpp>
#include <gacha_core/errors.hpp>

#include <limits>
#include <memory>

#include "test_sources.hpp"

using namespace gacha_core;

namespace {

BannerSystem make(std::shared_ptr<RandomSource> src,
                  std::vector<double> off_probs, int max_off, int pity = 90) {
  return BannerSystem(SoftPitySystem(pity, std::nullopt, std::move(src)),
                      std::move(off_probs), max_off);
}

} // namespace

TEST_CASE("construction sanitizes off probabilities and max_off") {
  SECTION("empty list becomes a single 0.5") {
    auto b = make(std::make_shared<PanicSource>(), {}, 0);
    REQUIRE(b.off_probs() == std::vector<double>{0.5});
    REQUIRE(b.max_off() == 1);
  }

  SECTION("entries outside (0, 1) become 0.5") {
    auto b = make(std::make_shared<PanicSource>(),
                  {0.0, 0.4, 1.0, -2.0, std::numeric_limits<double>::quiet_NaN()},
                  3);
    REQUIRE(b.off_probs() == std::vector<double>{0.5, 0.4, 0.5, 0.5, 0.5});
    REQUIRE(b.max_off() == 3);
  }

  SECTION("non-positive max_off defaults to the list length") {
    auto b = make(std::make_shared<PanicSource>(), {0.5, 0.4, 0.3}, -1);
    REQUIRE(b.max_off() == 3);
  }
}

TEST_CASE("a miss passes through without touching banner state") {
  auto b = make(std::make_shared<PanicSource>(), {0.5}, 1, 10);
  const BannerOutcome out = b.draw(0.0);
  REQUIRE_FALSE(out.hit);
  REQUIRE_FALSE(out.is_up);
  REQUIRE(out.count == 1);
  REQUIRE(out.off_streak == 0);
  REQUIRE_FALSE(out.guaranteed_next);
}

TEST_CASE("guarantee overrides a rigged off decision") {
  // p_base = 1 hits without entropy; the source then always picks "off".
  const int max_off = 2;
  auto src = std::make_shared<FixedSource>(0.0);
  auto b = make(src, {0.5}, max_off);

  for (int i = 1; i <= max_off + 1; ++i) {
    const BannerOutcome out = b.draw(1.0);
    REQUIRE(out.hit);
    REQUIRE_FALSE(out.is_up);
    REQUIRE(out.off_streak == i);
    REQUIRE(out.count == 0);
    // off_streak == max_off does not guarantee yet
    REQUIRE(out.guaranteed_next == (i > max_off));
  }
  REQUIRE(src->calls == static_cast<std::size_t>(max_off + 1));

  const BannerOutcome up = b.draw(1.0);
  REQUIRE(up.hit);
  REQUIRE(up.is_up);
  REQUIRE(up.off_streak == 0);
  REQUIRE_FALSE(up.guaranteed_next);
  // the guaranteed hit consumed no randomness
  REQUIRE(src->calls == static_cast<std::size_t>(max_off + 1));
}

TEST_CASE("guarantee survives misses until the next hit") {
  auto src = std::make_shared<FixedSource>(0.0);
  auto b = make(src, {0.5}, 1, 5);
  b.draw(1.0);
  const BannerOutcome second = b.draw(1.0);
  REQUIRE(second.guaranteed_next);

  for (int i = 0; i < 4; ++i) {
    const BannerOutcome miss = b.draw(0.0);
    REQUIRE_FALSE(miss.hit);
    REQUIRE(miss.guaranteed_next);
    REQUIRE(miss.off_streak == 2);
  }
  const BannerOutcome forced = b.draw(0.0); // hard pity at 5
  REQUIRE(forced.hit);
  REQUIRE(forced.is_up);
  REQUIRE_FALSE(b.guaranteed_next());
}

TEST_CASE("winning the off decision resets the streak") {
  // off_probs index follows the streak: 0.5 at streak 0, 0.4 at streak 1
  auto src = std::make_shared<ScriptedSource>(std::vector<double>{0.1, 0.45});
  auto b = make(src, {0.5, 0.4}, 5);

  REQUIRE(b.current_off_prob() == 0.5);
  const BannerOutcome off = b.draw(1.0);
  REQUIRE_FALSE(off.is_up);
  REQUIRE(b.current_off_prob() == 0.4);

  const BannerOutcome up = b.draw(1.0); // 0.45 >= 0.4 -> not off
  REQUIRE(up.is_up);
  REQUIRE(up.off_streak == 0);
  REQUIRE(b.current_off_prob() == 0.5);
}

TEST_CASE("last off probability repeats for long streaks") {
  auto src = std::make_shared<FixedSource>(0.0);
  auto b = make(src, {0.5, 0.3}, 10);
  for (int i = 0; i < 5; ++i)
    b.draw(1.0);
  REQUIRE(b.off_streak() == 5);
  REQUIRE(b.current_off_prob() == 0.3);
}

TEST_CASE("lowering max_off mid-sequence keeps the strict comparison") {
  auto src = std::make_shared<FixedSource>(0.0);
  auto b = make(src, {0.5}, 10);
  for (int i = 0; i < 4; ++i)
    b.draw(1.0);
  REQUIRE(b.off_streak() == 4);
  REQUIRE_FALSE(b.guaranteed_next());

  b.set_max_off(2);
  const BannerOutcome out = b.draw(1.0); // streak 5 > 2
  REQUIRE_FALSE(out.is_up);
  REQUIRE(out.guaranteed_next);
  REQUIRE(b.draw(1.0).is_up);
}

TEST_CASE("invalid base probability propagates from BannerSystem") {
  auto b = make(std::make_shared<PanicSource>(), {0.5}, 1);
  REQUIRE_THROWS_AS(b.draw(-1.0), InvalidProbability);
  REQUIRE(b.count() == 0);
}
