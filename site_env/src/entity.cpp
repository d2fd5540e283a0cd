#include "site_env/entity.hpp"
#include <algorithm>

namespace site {

const char* kind_name(EntityKind k) {
  switch (k) {
    case EntityKind::VEHICLE: return "vehicle";
    case EntityKind::PEDESTRIAN: return "pedestrian";
  }
  return "unknown";
}

bool parse_kind(const std::string& s, EntityKind& out) {
  if (s == "vehicle") { out = EntityKind::VEHICLE; return true; }
  if (s == "pedestrian") { out = EntityKind::PEDESTRIAN; return true; }
  return false;
}

bool EntityState::in_zone(const std::string& zone_id) const {
  return std::binary_search(zones.begin(), zones.end(), zone_id);
}

} // namespace site
