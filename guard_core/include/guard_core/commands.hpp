#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "guard_core/proximity.hpp"

namespace guard {

enum class BrakeAction { ENGAGE=0, RELEASE=1 };

enum class BrakeReason {
  BRAKING_BAND=0,            // governing entity inside the braking band
  PEDESTRIAN_BRAKING_BAND=1, // same, widened for a pedestrian in a shared zone
  RISK_CLEARED=2,
  GOVERNING_STALE=3,         // governing entity stopped reporting
  REASSERT=4                 // periodic repeat of the current brake level
};

const char* action_name(BrakeAction a);
bool parse_action(const std::string& s, BrakeAction& out);
const char* reason_name(BrakeReason r);
bool parse_reason(const std::string& s, BrakeReason& out);

struct AlertCommand {
  std::string vehicle_id;
  AlertLevel level = AlertLevel::NONE;
  double bearing_deg = 0.0;
  double distance_m = 0.0;
  std::string governing_id;
};

struct BrakeCommand {
  std::string vehicle_id;
  BrakeAction action = BrakeAction::RELEASE;
  BrakeReason reason = BrakeReason::RISK_CLEARED;
};

struct ZoneAlertCommand {
  std::string vehicle_id;
  std::string zone_id;
  std::string light_target; // empty: vehicle only
};

// Zone no longer occupied by any vehicle; light controller only.
struct ZoneClearCommand {
  std::string zone_id;
  std::string light_target;
};

struct HeartbeatCommand {
  std::string vehicle_id;
  std::uint64_t tick = 0;
};

// Everything decided in one tick, or decoded from one message.
struct CommandBatch {
  std::vector<BrakeCommand> brakes;
  std::vector<AlertCommand> alerts;
  std::vector<ZoneAlertCommand> zone_alerts;
  std::vector<ZoneClearCommand> zone_clears;
  std::vector<HeartbeatCommand> heartbeats;

  void append(const CommandBatch& other);
  bool empty() const;
  std::size_t size() const;
};

} // namespace guard
