#include "gacha_core/session.hpp"
#include "gacha_core/draw.hpp"

#include <functional>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace gacha_core {

std::shared_ptr<RandomSource>
SessionStore::source_for_(const std::string &id) const {
  if (!seed_)
    return default_random_source();
  const auto h = static_cast<std::uint64_t>(std::hash<std::string>{}(id));
  return std::make_shared<SeededRandom>(mix_seed(*seed_, h));
}

SoftPitySystem SessionStore::resolve_(const EngineSpec &spec,
                                      std::shared_ptr<RandomSource> source) {
  return SoftPitySystem(spec.pity,
                        make_soft_pity_config(spec.pity, spec.start_at,
                                              spec.start_pct, spec.target_prob,
                                              spec.easing),
                        std::move(source));
}

bool SessionStore::matches_(const Session &s, const EngineSpec &spec,
                            const SoftPitySystem &resolved) {
  if (!s.banner && !s.soft)
    return false;
  const SoftPitySystem &current = s.banner ? s.banner->soft_pity() : *s.soft;
  return current.pity() == resolved.pity() &&
         current.soft() == resolved.soft() &&
         s.spec.off_probs == spec.off_probs && s.spec.max_off == spec.max_off;
}

// Only counters restart; the session keeps advancing its own stream.
void SessionStore::build_(Session &s, const EngineSpec &spec) const {
  SoftPitySystem soft = resolve_(spec, s.source);
  s.banner.reset();
  s.soft.reset();
  if (spec.has_banner()) {
    s.banner.emplace(std::move(soft), spec.off_probs, spec.max_off);
  } else {
    s.soft.emplace(std::move(soft));
  }
  s.spec = spec;
}

std::shared_ptr<SessionStore::Session>
SessionStore::find_(const std::string &session) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = sessions_.find(session);
  if (it == sessions_.end())
    return nullptr;
  return it->second;
}

std::shared_ptr<SessionStore::Session>
SessionStore::find_or_create_(const std::string &session) {
  std::lock_guard<std::mutex> lock(mu_);
  auto &slot = sessions_[session];
  if (!slot) {
    slot = std::make_shared<Session>();
    slot->source = source_for_(session);
  }
  return slot;
}

SessionDraws SessionStore::draw_n(const std::string &session,
                                  const EngineSpec &spec, double p, int n) {
  if (n <= 0) {
    throw std::invalid_argument(
        fmt::format("draw_n: n must be positive, got {}", n));
  }
  validate_probability(p);
  // Throws on a bad spec before a session slot is created for it.
  const SoftPitySystem resolved = resolve_(spec, nullptr);

  auto s = find_or_create_(session);
  std::lock_guard<std::mutex> lock(s->mu);
  if (!matches_(*s, spec, resolved)) {
    build_(*s, spec);
  }

  SessionDraws res;
  res.outcomes.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    if (s->banner) {
      res.outcomes.push_back(s->banner->draw(p));
    } else {
      BannerOutcome out;
      out.hit = s->soft->draw(p);
      out.count = s->soft->count();
      res.outcomes.push_back(out);
    }
  }

  if (s->banner) {
    res.count = s->banner->count();
    res.guaranteed_next = s->banner->guaranteed_next();
    res.off_streak = s->banner->off_streak();
  } else {
    res.count = s->soft->count();
  }
  return res;
}

bool SessionStore::reset(const std::string &session) {
  auto s = find_(session);
  if (!s)
    return false;
  std::lock_guard<std::mutex> lock(s->mu);
  if (!s->banner && !s->soft)
    return false;
  build_(*s, s->spec);
  return true;
}

bool SessionStore::erase(const std::string &session) {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.erase(session) > 0;
}

bool SessionStore::has(const std::string &session) const {
  return find_(session) != nullptr;
}

std::size_t SessionStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.size();
}

} // namespace gacha_core
