#include "site_env/config.hpp"
#include <cmath>

namespace site {

static bool fail(std::string* why, const std::string& msg) {
  if (why) *why = msg;
  return false;
}

bool validate(const ThresholdConfig& c, std::string* why) {
  if (!(std::isfinite(c.proximity_m) && std::isfinite(c.warning_m) &&
        std::isfinite(c.braking_m) && std::isfinite(c.pedestrian_multiplier)))
    return fail(why, "non-finite threshold");
  if (c.braking_m <= 0.0) return fail(why, "brakingDistance must be > 0");
  if (c.warning_m <= c.braking_m) return fail(why, "warningDistance must exceed brakingDistance");
  if (c.proximity_m <= c.warning_m) return fail(why, "proximityDistance must exceed warningDistance");
  if (c.pedestrian_multiplier < 1.0) return fail(why, "pedestrianZoneBandMultiplier must be >= 1");
  return true;
}

const ThresholdConfig& ThresholdTable::for_vehicle(const std::string& vehicle_id) const {
  auto it = vehicles.find(vehicle_id);
  return (it != vehicles.end()) ? it->second : defaults;
}

bool validate(const EngineConfig& c, std::string* why) {
  if (!(c.tick_period_s > 0.0)) return fail(why, "tick_period_s must be > 0");
  if (!(c.liveness_window_s > 0.0)) return fail(why, "liveness_window_s must be > 0");
  if (c.debounce_ticks < 1) return fail(why, "debounce_ticks must be >= 1");
  if (!(c.lookahead_s >= 0.0)) return fail(why, "lookahead_s must be >= 0");
  if (!(c.jitter_filter_m >= 0.0)) return fail(why, "jitter_filter_m must be >= 0");
  if (c.worker_threads < 1) return fail(why, "worker_threads must be >= 1");
  if (c.heartbeat_every_ticks < 1) return fail(why, "heartbeat_every_ticks must be >= 1");
  if (c.brake_reassert_every_ticks < 0) return fail(why, "brake_reassert_every_ticks must be >= 0");
  return true;
}

} // namespace site
