#pragma once
#include <map>
#include <string>
#include "site_env/site.hpp"

namespace site {

// Distance bands for one vehicle. proximity > warning > braking > 0.
struct ThresholdConfig {
  std::string vehicle_id;           // empty for the site-wide default
  double proximity_m = 0.0;
  double warning_m = 0.0;
  double braking_m = 0.0;
  double pedestrian_multiplier = 1.0; // applied to all bands in shared pedestrian zones
};

// Returns false and fills `why` when the bands are not strictly ordered.
bool validate(const ThresholdConfig& c, std::string* why = nullptr);

struct ThresholdTable {
  ThresholdConfig defaults;
  std::map<std::string, ThresholdConfig> vehicles;
  int version = 0;

  const ThresholdConfig& for_vehicle(const std::string& vehicle_id) const;
};

// Engine knobs. Loaders require liveness, debounce and lookahead to be given.
struct EngineConfig {
  double tick_period_s = 0.1;
  double liveness_window_s = 0.0;
  int debounce_ticks = 0;
  double lookahead_s = 0.0;
  double jitter_filter_m = 0.0;    // 0 disables
  int worker_threads = 1;
  int heartbeat_every_ticks = 1;
  int brake_reassert_every_ticks = 0; // 0 disables
  double vehicle_failsafe_timeout_s = 0.0; // used by simulated vehicles only
};

bool validate(const EngineConfig& c, std::string* why = nullptr);

struct SiteConfig {
  EngineConfig engine;
  SiteMap site;
  ThresholdTable thresholds;
};

} // namespace site
