#include "site_env/registry.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace site {

const char* fix_status_name(FixStatus s) {
  switch (s) {
    case FixStatus::ACCEPTED: return "ACCEPTED";
    case FixStatus::STALE_TIMESTAMP: return "STALE_TIMESTAMP";
    case FixStatus::KIND_MISMATCH: return "KIND_MISMATCH";
    case FixStatus::INVALID_FIX: return "INVALID_FIX";
  }
  return "UNKNOWN";
}

const EntityState* Snapshot::find_live(const std::string& id) const {
  auto it = std::lower_bound(live.begin(), live.end(), id,
    [](const EntityState& e, const std::string& key) { return e.id < key; });
  if (it != live.end() && it->id == id) return &*it;
  return nullptr;
}

bool Snapshot::is_stale(const std::string& id) const {
  return std::binary_search(stale.begin(), stale.end(), id);
}

EntityRegistry::EntityRegistry(std::shared_ptr<const SiteMap> site, RegistryConfig cfg)
  : site_(std::move(site)), cfg_(cfg) {
  if (!site_) throw std::invalid_argument("EntityRegistry: site map is required");
  if (!(cfg_.liveness_window_s > 0.0))
    throw std::invalid_argument("EntityRegistry: liveness window must be > 0");
  if (!(cfg_.jitter_filter_m >= 0.0))
    throw std::invalid_argument("EntityRegistry: jitter filter must be >= 0");
}

FixStatus EntityRegistry::upsert(const PositionFix& fix) {
  return upsert(fix.entity_id, fix.kind, fix.pos, fix.t);
}

FixStatus EntityRegistry::upsert(const std::string& entity_id, EntityKind kind,
                                 const Vec2& pos, double t) {
  if (entity_id.empty() || !is_finite(pos) || !std::isfinite(t))
    return FixStatus::INVALID_FIX;

  {
    std::shared_lock<std::shared_mutex> map_lock(map_mtx_);
    auto it = slots_.find(entity_id);
    if (it != slots_.end()) {
      std::lock_guard<std::mutex> lock(it->second->m);
      return apply_fix(it->second->s, kind, pos, t);
    }
  }

  // first fix: creation takes the map exclusively
  std::unique_lock<std::shared_mutex> map_lock(map_mtx_);
  auto& slot = slots_[entity_id];
  if (slot) {
    // another thread created it in between
    std::lock_guard<std::mutex> lock(slot->m);
    return apply_fix(slot->s, kind, pos, t);
  }

  slot = std::make_unique<Slot>();
  EntityState& s = slot->s;
  s.id = entity_id;
  s.kind = kind;
  s.pos = pos;
  s.last_t = t;
  s.fixes = 1;
  s.zones = site_->zones_at(pos);
  return FixStatus::ACCEPTED;
}

FixStatus EntityRegistry::apply_fix(EntityState& s, EntityKind kind, const Vec2& pos, double t) const {
  if (kind != s.kind) return FixStatus::KIND_MISMATCH;
  // equal timestamps cannot advance the velocity estimate either
  if (t <= s.last_t) return FixStatus::STALE_TIMESTAMP;

  const double dt = t - s.last_t;
  const Vec2 disp = pos - s.pos;

  if (cfg_.jitter_filter_m > 0.0 && norm(disp) < cfg_.jitter_filter_m) {
    // localization noise: keep position and heading, the entity is stationary
    s.vel = {0.0, 0.0};
    s.last_t = t;
    s.fixes += 1;
    return FixStatus::ACCEPTED;
  }

  s.vel = disp * (1.0 / dt);
  if (norm(s.vel) > 0.0) {
    s.heading = direction_of(s.vel);
    s.has_heading = true;
  }
  s.pos = pos;
  s.last_t = t;
  s.fixes += 1;
  s.zones = site_->zones_at(pos);
  return FixStatus::ACCEPTED;
}

bool EntityRegistry::deregister(const std::string& entity_id) {
  std::unique_lock<std::shared_mutex> map_lock(map_mtx_);
  return slots_.erase(entity_id) > 0;
}

Snapshot EntityRegistry::snapshot(double now) const {
  Snapshot snap;
  snap.t = now;

  std::shared_lock<std::shared_mutex> map_lock(map_mtx_);
  snap.live.reserve(slots_.size());
  for (const auto& kv : slots_) {
    std::lock_guard<std::mutex> lock(kv.second->m);
    const EntityState& s = kv.second->s;
    if ((now - s.last_t) <= cfg_.liveness_window_s) snap.live.push_back(s);
    else snap.stale.push_back(s.id);
  }
  map_lock.unlock();

  std::sort(snap.live.begin(), snap.live.end(),
            [](const EntityState& a, const EntityState& b) { return a.id < b.id; });
  std::sort(snap.stale.begin(), snap.stale.end());
  return snap;
}

bool EntityRegistry::contains(const std::string& entity_id) const {
  std::shared_lock<std::shared_mutex> map_lock(map_mtx_);
  return slots_.count(entity_id) > 0;
}

std::size_t EntityRegistry::size() const {
  std::shared_lock<std::shared_mutex> map_lock(map_mtx_);
  return slots_.size();
}

} // namespace site
