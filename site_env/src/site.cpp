#include "site_env/site.hpp"
#include <algorithm>

namespace site {

const char* zone_kind_name(ZoneKind k) {
  switch (k) {
    case ZoneKind::PEDESTRIAN_WAY: return "pedestrian_way";
    case ZoneKind::BAD_SIGNAL: return "bad_signal";
  }
  return "unknown";
}

bool parse_zone_kind(const std::string& s, ZoneKind& out) {
  if (s == "pedestrian_way") { out = ZoneKind::PEDESTRIAN_WAY; return true; }
  if (s == "bad_signal") { out = ZoneKind::BAD_SIGNAL; return true; }
  return false;
}

const Zone* SiteMap::find(const std::string& id) const {
  for (const auto& z : zones) {
    if (z.id == id) return &z;
  }
  return nullptr;
}

std::vector<std::string> SiteMap::zones_at(const Vec2& p) const {
  std::vector<std::string> out;
  for (const auto& z : zones) {
    if (contains(z.area, p)) out.push_back(z.id);
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool SiteMap::any_of_kind(const std::vector<std::string>& ids, ZoneKind kind) const {
  for (const auto& id : ids) {
    const Zone* z = find(id);
    if (z && z->kind == kind) return true;
  }
  return false;
}

} // namespace site
