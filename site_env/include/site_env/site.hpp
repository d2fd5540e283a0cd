#pragma once
#include <string>
#include <vector>
#include "site_env/geometry.hpp"

namespace site {

enum class ZoneKind { PEDESTRIAN_WAY=0, BAD_SIGNAL=1 };

const char* zone_kind_name(ZoneKind k);
bool parse_zone_kind(const std::string& s, ZoneKind& out);

struct Zone {
  std::string id;
  ZoneKind kind = ZoneKind::PEDESTRIAN_WAY;
  Polygon area;
  std::string light_target; // light-controller output, empty if none
};

// Static floor layout. Zones do not change while the engine runs.
class SiteMap {
public:
  std::vector<Zone> zones;

  const Zone* find(const std::string& id) const;

  // Sorted ids of every zone whose area contains p.
  std::vector<std::string> zones_at(const Vec2& p) const;

  bool any_of_kind(const std::vector<std::string>& ids, ZoneKind kind) const;
};

} // namespace site
