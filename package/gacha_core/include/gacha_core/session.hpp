#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "gacha_core/banner.hpp"
#include "gacha_core/random_source.hpp"
#include "gacha_core/soft_pity.hpp"

namespace gacha_core {

// Engine configuration requested for a session. A session keeps its running
// counters for as long as requests resolve to the same engine (pity, ramp
// after start_pct resolution, off_probs, max_off).
struct EngineSpec {
  int pity{0};
  std::optional<int> start_at;
  std::optional<double> start_pct;
  std::optional<double> target_prob;
  Easing easing{Easing::Linear};
  std::vector<double> off_probs; // empty -> soft/hard pity only
  int max_off{0};

  bool has_banner() const { return !off_probs.empty(); }
};

// Result of a batch of draws on one session.
struct SessionDraws {
  std::vector<BannerOutcome> outcomes;
  int count{0};
  bool guaranteed_next{false};
  int off_streak{0};
};

// Per-session engines. The map is guarded by one mutex and every session by
// its own, so different sessions advance concurrently while draws on the
// same session are serialized.
class SessionStore {
public:
  // With a seed, session `id` draws from SeededRandom(mix_seed(seed, hash(id)));
  // otherwise all sessions share the default source.
  explicit SessionStore(std::optional<std::uint64_t> seed = std::nullopt)
      : seed_(seed) {}

  SessionStore(const SessionStore &) = delete;
  SessionStore &operator=(const SessionStore &) = delete;

  // n draws at base probability p. The session's engine is (re)built when it
  // does not exist yet or `spec` resolves to a different engine. A rebuild
  // resets the counters but not the session's random stream.
  // Throws std::invalid_argument for n <= 0, InvalidProbability for a bad p
  // (before any draw) and InvalidPityConfig for a bad spec.
  SessionDraws draw_n(const std::string &session, const EngineSpec &spec,
                      double p, int n);

  // Rebuilds the session's engine from its current spec (counters to 0);
  // draws continue on the session's stream.
  bool reset(const std::string &session);
  bool erase(const std::string &session);

  bool has(const std::string &session) const;
  std::size_t size() const;

private:
  struct Session {
    std::mutex mu;
    std::shared_ptr<RandomSource> source; // created once with the session
    EngineSpec spec;
    std::optional<BannerSystem> banner;
    std::optional<SoftPitySystem> soft;
  };

  std::shared_ptr<Session> find_(const std::string &session) const;
  std::shared_ptr<Session> find_or_create_(const std::string &session);
  static SoftPitySystem resolve_(const EngineSpec &spec,
                                 std::shared_ptr<RandomSource> source);
  static bool matches_(const Session &s, const EngineSpec &spec,
                       const SoftPitySystem &resolved);
  void build_(Session &s, const EngineSpec &spec) const;
  std::shared_ptr<RandomSource> source_for_(const std::string &id) const;

  std::optional<std::uint64_t> seed_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace gacha_core
