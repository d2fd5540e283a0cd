#pragma once
#include <string>
#include <vector>
#include "site_env/config.hpp"
#include "site_env/entity.hpp"
#include "site_env/registry.hpp"
#include "site_env/site.hpp"

namespace guard {

enum class AlertLevel { NONE=0, PROXIMITY=1, WARNING=2, BRAKING=3 };

const char* level_name(AlertLevel l);
bool parse_level(const std::string& s, AlertLevel& out);

struct Bands {
  double proximity_m = 0.0;
  double warning_m = 0.0;
  double braking_m = 0.0;
};

// Bands for one encounter. Pedestrians sharing a pedestrian way with the
// vehicle get the configured multiplier applied to every band.
Bands effective_bands(const site::ThresholdConfig& cfg, bool shared_zone_pedestrian);

// Strict: a distance equal to a band edge falls in the less severe band.
AlertLevel classify(double distance_m, const Bands& b);

struct RiskAssessment {
  std::string vehicle_id;
  std::string other_id;
  site::EntityKind other_kind = site::EntityKind::VEHICLE;

  double distance_m = 0.0;
  site::Vec2 rel_vel;          // other minus vehicle
  double closing_speed = 0.0;  // m/s, negative when separating
  double ttc_s = 0.0;          // infinity when not closing
  double bearing_deg = 0.0;    // clockwise from vehicle heading
  bool resolved = true;        // false: scored NONE, bearing meaningless
  bool shared_zone_pedestrian = false;
  bool fuzzy = false;          // other entity inside a bad-signal zone

  AlertLevel level = AlertLevel::NONE;
};

RiskAssessment assess_pair(const site::EntityState& vehicle, const site::EntityState& other,
                           const site::ThresholdConfig& cfg, const site::SiteMap& site);

// All assessments for one vehicle against every other live entity.
std::vector<RiskAssessment> assess_vehicle(const site::EntityState& vehicle,
                                           const site::Snapshot& snap,
                                           const site::ThresholdConfig& cfg,
                                           const site::SiteMap& site);

// Governing order: closer first, then smaller time-to-collision, then id.
bool governs_before(const RiskAssessment& a, const RiskAssessment& b);

// Governing candidate among assessments above NONE, or nullptr.
const RiskAssessment* select_governing(const std::vector<RiskAssessment>& assessments);

} // namespace guard
