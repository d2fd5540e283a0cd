#pragma once
#include <string>
#include <vector>
#include "site_env/geometry.hpp"

namespace site {

enum class EntityKind { VEHICLE=0, PEDESTRIAN=1 };

const char* kind_name(EntityKind k);
bool parse_kind(const std::string& s, EntityKind& out);

struct PositionFix {
  std::string entity_id;
  EntityKind kind = EntityKind::VEHICLE;
  Vec2 pos;
  double t = 0.0;     // seconds
};

struct EntityState {
  std::string id;
  EntityKind kind = EntityKind::VEHICLE;

  Vec2 pos;
  Vec2 vel;                 // m/s, from the two most recent fixes
  double heading = 0.0;     // radians, last non-zero direction of travel
  bool has_heading = false; // false until the entity has moved once
  double last_t = 0.0;      // seconds
  int fixes = 0;

  std::vector<std::string> zones; // sorted zone ids containing pos

  bool in_zone(const std::string& zone_id) const;
};

} // namespace site
