#include "guard_core/proximity.hpp"
#include <cmath>
#include <limits>

namespace guard {

static constexpr double kInf = std::numeric_limits<double>::infinity();

const char* level_name(AlertLevel l) {
  switch (l) {
    case AlertLevel::NONE: return "NONE";
    case AlertLevel::PROXIMITY: return "PROXIMITY";
    case AlertLevel::WARNING: return "WARNING";
    case AlertLevel::BRAKING: return "BRAKING";
  }
  return "UNKNOWN";
}

bool parse_level(const std::string& s, AlertLevel& out) {
  if (s == "NONE") { out = AlertLevel::NONE; return true; }
  if (s == "PROXIMITY") { out = AlertLevel::PROXIMITY; return true; }
  if (s == "WARNING") { out = AlertLevel::WARNING; return true; }
  if (s == "BRAKING") { out = AlertLevel::BRAKING; return true; }
  return false;
}

Bands effective_bands(const site::ThresholdConfig& cfg, bool shared_zone_pedestrian) {
  const double k = shared_zone_pedestrian ? cfg.pedestrian_multiplier : 1.0;
  return {cfg.proximity_m * k, cfg.warning_m * k, cfg.braking_m * k};
}

AlertLevel classify(double distance_m, const Bands& b) {
  if (!std::isfinite(distance_m) || distance_m < 0.0) return AlertLevel::NONE;
  if (distance_m < b.braking_m) return AlertLevel::BRAKING;
  if (distance_m < b.warning_m) return AlertLevel::WARNING;
  if (distance_m < b.proximity_m) return AlertLevel::PROXIMITY;
  return AlertLevel::NONE;
}

static bool shares_pedestrian_way(const site::EntityState& vehicle, const site::EntityState& other,
                                  const site::SiteMap& site) {
  if (other.kind != site::EntityKind::PEDESTRIAN) return false;
  for (const auto& zone_id : other.zones) {
    const site::Zone* z = site.find(zone_id);
    if (z && z->kind == site::ZoneKind::PEDESTRIAN_WAY && vehicle.in_zone(zone_id)) return true;
  }
  return false;
}

RiskAssessment assess_pair(const site::EntityState& vehicle, const site::EntityState& other,
                           const site::ThresholdConfig& cfg, const site::SiteMap& site) {
  RiskAssessment a;
  a.vehicle_id = vehicle.id;
  a.other_id = other.id;
  a.other_kind = other.kind;

  const site::Vec2 r = other.pos - vehicle.pos;
  a.rel_vel = other.vel - vehicle.vel;
  a.distance_m = site::norm(r);

  if (a.distance_m > 0.0) {
    a.closing_speed = -site::dot(r, a.rel_vel) / a.distance_m;
    a.ttc_s = (a.closing_speed > 0.0) ? a.distance_m / a.closing_speed : kInf;
  } else {
    a.closing_speed = 0.0;
    a.ttc_s = 0.0;
  }

  const bool vehicle_fuzzy = site.any_of_kind(vehicle.zones, site::ZoneKind::BAD_SIGNAL);
  a.fuzzy = site.any_of_kind(other.zones, site::ZoneKind::BAD_SIGNAL);

  a.resolved = vehicle.has_heading &&
               std::isfinite(a.distance_m) &&
               std::isfinite(a.closing_speed) &&
               !(vehicle_fuzzy && a.fuzzy);
  if (!a.resolved) {
    a.level = AlertLevel::NONE;
    return a;
  }

  a.bearing_deg = site::relative_bearing_deg(vehicle.pos, vehicle.heading, other.pos);
  a.shared_zone_pedestrian = shares_pedestrian_way(vehicle, other, site);
  a.level = classify(a.distance_m, effective_bands(cfg, a.shared_zone_pedestrian));
  return a;
}

std::vector<RiskAssessment> assess_vehicle(const site::EntityState& vehicle,
                                           const site::Snapshot& snap,
                                           const site::ThresholdConfig& cfg,
                                           const site::SiteMap& site) {
  std::vector<RiskAssessment> out;
  out.reserve(snap.live.size());
  for (const auto& other : snap.live) {
    if (other.id == vehicle.id) continue;
    out.push_back(assess_pair(vehicle, other, cfg, site));
  }
  return out;
}

bool governs_before(const RiskAssessment& a, const RiskAssessment& b) {
  if (a.distance_m != b.distance_m) return a.distance_m < b.distance_m;
  if (a.ttc_s != b.ttc_s) return a.ttc_s < b.ttc_s;
  return a.other_id < b.other_id;
}

const RiskAssessment* select_governing(const std::vector<RiskAssessment>& assessments) {
  const RiskAssessment* best = nullptr;
  for (const auto& a : assessments) {
    if (a.level == AlertLevel::NONE) continue;
    if (!best || governs_before(a, *best)) best = &a;
  }
  return best;
}

} // namespace guard
