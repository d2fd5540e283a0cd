#pragma once
#include <string>
#include <vector>
#include "site_env/config.hpp"
#include "site_env/entity.hpp"
#include "site_env/registry.hpp"

namespace site {

// Window during which messages to a simulated vehicle are dropped.
struct LinkLoss {
  std::string vehicle_id;
  double from_t = 0.0;
  double to_t = 0.0;
};

// Recorded position feed used for replay.
struct Feed {
  std::vector<PositionFix> fixes; // sorted by t, stable for equal t
  std::vector<LinkLoss> link_loss;

  double start_t() const;
  double end_t() const;

  // Upserts fixes[cursor..] with t <= until into reg and advances cursor.
  // Returns the number of rejected fixes.
  std::size_t replay_into(EntityRegistry& reg, std::size_t& cursor, double until) const;

  bool link_down(const std::string& vehicle_id, double t) const;
};

class Scenario {
public:
  // All loaders throw std::runtime_error naming the source and the problem.
  static SiteConfig load_site_file(const std::string& path);
  static SiteConfig parse_site(const std::string& text);

  // Threshold section alone, for hot reload from a site file.
  static ThresholdTable load_thresholds_file(const std::string& path);

  static Feed load_feed_file(const std::string& path);
  static Feed parse_feed(const std::string& text);
};

} // namespace site
