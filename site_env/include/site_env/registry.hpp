#pragma once
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "site_env/entity.hpp"
#include "site_env/site.hpp"

namespace site {

enum class FixStatus { ACCEPTED=0, STALE_TIMESTAMP=1, KIND_MISMATCH=2, INVALID_FIX=3 };

const char* fix_status_name(FixStatus s);

struct RegistryConfig {
  double liveness_window_s = 0.0;
  double jitter_filter_m = 0.0; // moves shorter than this only refresh liveness
};

// Immutable view taken at one instant.
struct Snapshot {
  double t = 0.0;
  std::vector<EntityState> live;   // sorted by id
  std::vector<std::string> stale;  // sorted

  const EntityState* find_live(const std::string& id) const;
  bool is_stale(const std::string& id) const;
};

// Latest state per entity. Upserts for one entity are serialized; upserts for
// distinct entities run concurrently. Snapshots may run alongside upserts.
class EntityRegistry {
public:
  EntityRegistry(std::shared_ptr<const SiteMap> site, RegistryConfig cfg);

  FixStatus upsert(const std::string& entity_id, EntityKind kind, const Vec2& pos, double t);
  FixStatus upsert(const PositionFix& fix);

  // Removes an entity for good. Returns false if it was not registered.
  bool deregister(const std::string& entity_id);

  Snapshot snapshot(double now) const;

  bool contains(const std::string& entity_id) const;
  std::size_t size() const;

private:
  struct Slot {
    std::mutex m;
    EntityState s;
  };

  FixStatus apply_fix(EntityState& s, EntityKind kind, const Vec2& pos, double t) const;

  std::shared_ptr<const SiteMap> site_;
  RegistryConfig cfg_;

  mutable std::shared_mutex map_mtx_;
  std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace site
