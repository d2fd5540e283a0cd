#include "guard_core/commands.hpp"

namespace guard {

const char* action_name(BrakeAction a) {
  switch (a) {
    case BrakeAction::ENGAGE: return "engage";
    case BrakeAction::RELEASE: return "release";
  }
  return "unknown";
}

bool parse_action(const std::string& s, BrakeAction& out) {
  if (s == "engage") { out = BrakeAction::ENGAGE; return true; }
  if (s == "release") { out = BrakeAction::RELEASE; return true; }
  return false;
}

static const BrakeReason kReasons[] = {
  BrakeReason::BRAKING_BAND, BrakeReason::PEDESTRIAN_BRAKING_BAND, BrakeReason::RISK_CLEARED,
  BrakeReason::GOVERNING_STALE, BrakeReason::REASSERT,
};

const char* reason_name(BrakeReason r) {
  switch (r) {
    case BrakeReason::BRAKING_BAND: return "BRAKING_BAND";
    case BrakeReason::PEDESTRIAN_BRAKING_BAND: return "PEDESTRIAN_BRAKING_BAND";
    case BrakeReason::RISK_CLEARED: return "RISK_CLEARED";
    case BrakeReason::GOVERNING_STALE: return "GOVERNING_STALE";
    case BrakeReason::REASSERT: return "REASSERT";
  }
  return "UNKNOWN";
}

bool parse_reason(const std::string& s, BrakeReason& out) {
  for (BrakeReason r : kReasons) {
    if (s == reason_name(r)) {
      out = r;
      return true;
    }
  }
  return false;
}

template <typename T>
static void extend(std::vector<T>& dst, const std::vector<T>& src) {
  dst.insert(dst.end(), src.begin(), src.end());
}

void CommandBatch::append(const CommandBatch& other) {
  extend(brakes, other.brakes);
  extend(alerts, other.alerts);
  extend(zone_alerts, other.zone_alerts);
  extend(zone_clears, other.zone_clears);
  extend(heartbeats, other.heartbeats);
}

bool CommandBatch::empty() const { return size() == 0; }

std::size_t CommandBatch::size() const {
  return brakes.size() + alerts.size() + zone_alerts.size() + zone_clears.size() + heartbeats.size();
}

} // namespace guard
