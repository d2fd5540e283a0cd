#pragma once
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "guard_core/commands.hpp"
#include "site_env/entity.hpp"
#include "site_env/site.hpp"

namespace guard {

struct ZoneHit {
  std::string vehicle_id;
  std::string zone_id;
  bool projected = false; // only the lookahead path reaches the zone
};

// Pedestrian ways the vehicle occupies or will reach within lookahead_s at its
// current velocity. Pure; safe to call for many vehicles in parallel.
std::vector<ZoneHit> pedestrian_way_hits(const site::EntityState& vehicle,
                                         const site::SiteMap& site, double lookahead_s);

// Turns per-tick hits into zone alerts (every tick a hit holds) and zone clears
// (once, when a lit zone empties). Independent from the alert state machine.
class PedestrianWayMonitor {
public:
  explicit PedestrianWayMonitor(std::shared_ptr<const site::SiteMap> site);

  void update(const std::vector<ZoneHit>& hits, CommandBatch& out);

  bool active(const std::string& vehicle_id, const std::string& zone_id) const;
  std::size_t active_count() const { return active_.size(); }

private:
  std::shared_ptr<const site::SiteMap> site_;
  std::set<std::pair<std::string, std::string>> active_; // (vehicle, zone)
};

} // namespace guard
