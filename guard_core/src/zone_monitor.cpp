#include "guard_core/zone_monitor.hpp"
#include <stdexcept>

namespace guard {

std::vector<ZoneHit> pedestrian_way_hits(const site::EntityState& vehicle,
                                         const site::SiteMap& site, double lookahead_s) {
  std::vector<ZoneHit> hits;
  const site::Vec2 ahead = vehicle.pos + vehicle.vel * lookahead_s;

  for (const auto& z : site.zones) {
    if (z.kind != site::ZoneKind::PEDESTRIAN_WAY) continue;
    if (vehicle.in_zone(z.id)) {
      hits.push_back({vehicle.id, z.id, false});
    } else if (site::segment_enters(z.area, vehicle.pos, ahead)) {
      hits.push_back({vehicle.id, z.id, true});
    }
  }
  return hits;
}

PedestrianWayMonitor::PedestrianWayMonitor(std::shared_ptr<const site::SiteMap> site)
  : site_(std::move(site)) {
  if (!site_) throw std::invalid_argument("PedestrianWayMonitor: site map is required");
}

void PedestrianWayMonitor::update(const std::vector<ZoneHit>& hits, CommandBatch& out) {
  std::set<std::pair<std::string, std::string>> now_active;
  for (const auto& h : hits) now_active.emplace(h.vehicle_id, h.zone_id);

  std::set<std::string> lit_before;
  for (const auto& key : active_) lit_before.insert(key.second);

  // repeated every tick while the hit holds
  for (const auto& key : now_active) {
    const site::Zone* z = site_->find(key.second);
    out.zone_alerts.push_back({key.first, key.second, z ? z->light_target : std::string()});
  }

  std::set<std::string> lit_now;
  for (const auto& key : now_active) lit_now.insert(key.second);

  for (const auto& zone_id : lit_before) {
    if (lit_now.count(zone_id)) continue;
    const site::Zone* z = site_->find(zone_id);
    if (z && !z->light_target.empty()) out.zone_clears.push_back({zone_id, z->light_target});
  }

  active_.swap(now_active);
}

bool PedestrianWayMonitor::active(const std::string& vehicle_id, const std::string& zone_id) const {
  return active_.count(std::make_pair(vehicle_id, zone_id)) > 0;
}

} // namespace guard
