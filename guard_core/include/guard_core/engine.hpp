#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "guard_core/alert_fsm.hpp"
#include "guard_core/commands.hpp"
#include "guard_core/proximity.hpp"
#include "guard_core/publisher.hpp"
#include "guard_core/zone_monitor.hpp"
#include "site_env/config.hpp"
#include "site_env/registry.hpp"

namespace guard {

enum class ConditionKind { STALE_ENTITY=0, UNKNOWN_VEHICLE=1, TICK_OVERRUN=2 };

const char* condition_name(ConditionKind k);

struct Condition {
  ConditionKind kind = ConditionKind::STALE_ENTITY;
  std::string subject; // entity or vehicle id, empty for engine-wide
  std::string detail;
};

struct VehicleDecision {
  std::string vehicle_id;
  bool live = true;
  AlertLevel level = AlertLevel::NONE;
  std::string governing_id;
  std::vector<RiskAssessment> assessments;
};

struct TickReport {
  std::uint64_t tick = 0;
  double t = 0.0;
  std::vector<VehicleDecision> vehicles; // sorted by vehicle id
  CommandBatch commands;
  std::vector<Condition> conditions;
  std::size_t messages_sent = 0;
  double elapsed_s = 0.0;  // wall time spent in the tick
};

// Hot-reloadable thresholds. Readers keep the table they got for a whole tick.
class ThresholdStore {
public:
  explicit ThresholdStore(site::ThresholdTable initial);

  std::shared_ptr<const site::ThresholdTable> current() const;

  // Takes effect from the next tick. Bumps the version past the current one.
  void replace(site::ThresholdTable next);

private:
  mutable std::mutex mtx_;
  std::shared_ptr<const site::ThresholdTable> table_;
};

// Periodic evaluation: snapshot, per-vehicle risk and alert decisions in
// parallel, pedestrian-way monitoring, publish. Fixes may be upserted into
// registry() from any thread at any time. A vehicle that stops reporting keeps
// its alert level and gets no heartbeats, so its own watchdog brakes it.
class Engine {
public:
  Engine(const site::EngineConfig& cfg, std::shared_ptr<const site::SiteMap> site,
         site::ThresholdTable thresholds, Transport& transport);

  site::EntityRegistry& registry() { return registry_; }
  ThresholdStore& thresholds() { return thresholds_; }
  const site::EngineConfig& config() const { return cfg_; }

  // One full evaluation at time `now` (seconds, same clock as the fixes).
  TickReport tick(double now);

  // Ticks every cfg.tick_period_s until `stop` is set. Overruns are logged and
  // the next tick starts at once; missed ticks are not replayed.
  void run(const std::atomic<bool>& stop, const std::function<double()>& clock,
           const std::function<void(const TickReport&)>& on_report);

  // nullptr when the vehicle has never been evaluated.
  const AlertState* alert_state(const std::string& vehicle_id) const;

  std::uint64_t ticks() const { return tick_count_; }

private:
  AlertFsm& fsm_for(const std::string& vehicle_id);
  void report_unknown_vehicles(const site::ThresholdTable& table, const site::Snapshot& snap,
                               TickReport& report);

  site::EngineConfig cfg_;
  std::shared_ptr<const site::SiteMap> site_;
  site::EntityRegistry registry_;
  ThresholdStore thresholds_;
  CommandPublisher publisher_;
  PedestrianWayMonitor zones_;

  std::map<std::string, AlertFsm> fsms_;
  std::uint64_t tick_count_ = 0;
  int unknown_reported_version_ = -1;
  std::set<std::string> unknown_reported_;
};

} // namespace guard
