#include "guard_core/engine.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include "site_env/log.hpp"

namespace guard {

const char* condition_name(ConditionKind k) {
  switch (k) {
    case ConditionKind::STALE_ENTITY: return "STALE_ENTITY";
    case ConditionKind::UNKNOWN_VEHICLE: return "UNKNOWN_VEHICLE";
    case ConditionKind::TICK_OVERRUN: return "TICK_OVERRUN";
  }
  return "UNKNOWN";
}

ThresholdStore::ThresholdStore(site::ThresholdTable initial)
  : table_(std::make_shared<const site::ThresholdTable>(std::move(initial))) {}

std::shared_ptr<const site::ThresholdTable> ThresholdStore::current() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return table_;
}

void ThresholdStore::replace(site::ThresholdTable next) {
  std::lock_guard<std::mutex> lock(mtx_);
  next.version = std::max(next.version, table_->version + 1);
  table_ = std::make_shared<const site::ThresholdTable>(std::move(next));
}

static const site::EngineConfig& checked(const site::EngineConfig& cfg) {
  std::string why;
  if (!site::validate(cfg, &why)) throw std::invalid_argument("Engine: " + why);
  return cfg;
}

// Runs fn(0..n-1) on up to `workers` threads; each index runs exactly once.
template <typename Fn>
static void parallel_for(std::size_t n, int workers, Fn fn) {
  if (workers <= 1 || n < 2) {
    for (std::size_t i = 0; i < n; ++i) fn(i);
    return;
  }

  const std::size_t chunk = (n + workers - 1) / workers;
  std::vector<std::future<void>> jobs;
  for (std::size_t begin = 0; begin < n; begin += chunk) {
    const std::size_t end = std::min(n, begin + chunk);
    jobs.push_back(std::async(std::launch::async, [begin, end, &fn] {
      for (std::size_t i = begin; i < end; ++i) fn(i);
    }));
  }
  // get() rethrows, but only after every chunk has finished
  for (auto& j : jobs) j.wait();
  for (auto& j : jobs) j.get();
}

Engine::Engine(const site::EngineConfig& cfg, std::shared_ptr<const site::SiteMap> site,
               site::ThresholdTable thresholds, Transport& transport)
  : cfg_(checked(cfg)),
    site_(std::move(site)),
    registry_(site_, site::RegistryConfig{cfg.liveness_window_s, cfg.jitter_filter_m}),
    thresholds_(std::move(thresholds)),
    publisher_(transport),
    zones_(site_) {}

AlertFsm& Engine::fsm_for(const std::string& vehicle_id) {
  auto it = fsms_.find(vehicle_id);
  if (it == fsms_.end()) {
    AlertFsm fsm;
    fsm.vehicle_id = vehicle_id;
    fsm.cfg.debounce_ticks = cfg_.debounce_ticks;
    it = fsms_.emplace(vehicle_id, fsm).first;
  }
  return it->second;
}

const AlertState* Engine::alert_state(const std::string& vehicle_id) const {
  auto it = fsms_.find(vehicle_id);
  return (it != fsms_.end()) ? &it->second.state : nullptr;
}

void Engine::report_unknown_vehicles(const site::ThresholdTable& table, const site::Snapshot& snap,
                                     TickReport& report) {
  if (table.version != unknown_reported_version_) {
    unknown_reported_version_ = table.version;
    unknown_reported_.clear();
  }

  for (const auto& kv : table.vehicles) {
    if (fsms_.count(kv.first)) continue;

    std::string detail = "never seen";
    if (snap.find_live(kv.first)) detail = "registered as pedestrian";
    else if (snap.is_stale(kv.first) || registry_.contains(kv.first)) detail = "registered, not reporting";
    report.conditions.push_back({ConditionKind::UNKNOWN_VEHICLE, kv.first, detail});
    if (unknown_reported_.insert(kv.first).second) {
      AISLEGUARD_LOG(WARN, "engine") << "thresholds for " << kv.first << " ignored until it registers ("
                                     << detail << ", config v" << table.version << ")";
    }
  }
}

namespace {

struct VehicleJob {
  const site::EntityState* vehicle = nullptr; // null: not live this tick
  AlertFsm* fsm = nullptr;
  VehicleDecision decision;
  CommandBatch commands;
  std::vector<ZoneHit> hits;
};

} // namespace

TickReport Engine::tick(double now) {
  const auto wall0 = std::chrono::steady_clock::now();

  TickReport report;
  report.tick = ++tick_count_;
  report.t = now;

  const site::Snapshot snap = registry_.snapshot(now);
  const std::shared_ptr<const site::ThresholdTable> table = thresholds_.current();

  for (const auto& id : snap.stale) {
    report.conditions.push_back({ConditionKind::STALE_ENTITY, id, "no fix within liveness window"});
  }

  // every live vehicle, plus vehicles with alert state that dropped out
  std::vector<VehicleJob> jobs;
  for (const auto& e : snap.live) {
    if (e.kind != site::EntityKind::VEHICLE) continue;
    VehicleJob job;
    job.vehicle = &e;
    job.fsm = &fsm_for(e.id);
    jobs.push_back(std::move(job));
  }
  for (auto& kv : fsms_) {
    if (snap.find_live(kv.first)) continue;
    VehicleJob job;
    job.fsm = &kv.second;
    jobs.push_back(std::move(job));
  }
  std::sort(jobs.begin(), jobs.end(), [](const VehicleJob& a, const VehicleJob& b) {
    return a.fsm->vehicle_id < b.fsm->vehicle_id;
  });

  report_unknown_vehicles(*table, snap, report);

  const site::SiteMap& site = *site_;
  const double lookahead = cfg_.lookahead_s;

  // vehicles are independent: shared snapshot is read-only, each job owns its fsm
  parallel_for(jobs.size(), cfg_.worker_threads, [&](std::size_t i) {
    VehicleJob& job = jobs[i];
    AlertFsm& fsm = *job.fsm;
    job.decision.vehicle_id = fsm.vehicle_id;

    if (job.vehicle) {
      const site::ThresholdConfig& cfg = table->for_vehicle(fsm.vehicle_id);
      job.decision.assessments = assess_vehicle(*job.vehicle, snap, cfg, site);
      const RiskAssessment* governing = select_governing(job.decision.assessments);

      BrakeReason clear = BrakeReason::RISK_CLEARED;
      if (!fsm.state.governing_id.empty() && !snap.find_live(fsm.state.governing_id))
        clear = BrakeReason::GOVERNING_STALE;

      fsm.step(governing, now, clear, job.commands);
      job.hits = pedestrian_way_hits(*job.vehicle, site, lookahead);
    } else {
      // silent vehicle: hold the level, the vehicle watchdog takes over
      job.decision.live = false;
    }

    job.decision.level = fsm.state.level;
    job.decision.governing_id = fsm.state.governing_id;
  });

  std::vector<ZoneHit> hits;
  for (auto& job : jobs) {
    for (const auto& b : job.commands.brakes) {
      AISLEGUARD_LOG(INFO, "engine") << b.vehicle_id << " brake " << action_name(b.action)
                                     << " (" << reason_name(b.reason) << ")";
    }
    report.commands.append(job.commands);
    hits.insert(hits.end(), job.hits.begin(), job.hits.end());
  }
  zones_.update(hits, report.commands);

  if (cfg_.brake_reassert_every_ticks > 0 && report.tick % cfg_.brake_reassert_every_ticks == 0) {
    for (const auto& job : jobs) {
      // a transition this tick already carries the current level
      if (!job.vehicle || !job.commands.brakes.empty()) continue;
      BrakeAction level = (job.fsm->state.level == AlertLevel::BRAKING) ? BrakeAction::ENGAGE
                                                                         : BrakeAction::RELEASE;
      report.commands.brakes.push_back({job.fsm->vehicle_id, level, BrakeReason::REASSERT});
    }
  }

  if (report.tick % cfg_.heartbeat_every_ticks == 0) {
    for (const auto& job : jobs) {
      if (!job.vehicle) continue;
      report.commands.heartbeats.push_back({job.fsm->vehicle_id, report.tick});
    }
  }

  for (auto& job : jobs) report.vehicles.push_back(std::move(job.decision));

  for (auto it = fsms_.begin(); it != fsms_.end();) {
    if (!registry_.contains(it->first)) {
      AISLEGUARD_LOG(DEBUG, "engine") << "dropping " << level_name(it->second.state.level)
                                      << " alert state for deregistered " << it->first;
      it = fsms_.erase(it);
    } else {
      ++it;
    }
  }

  report.messages_sent = publisher_.publish(report.commands);
  report.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - wall0).count();
  return report;
}

void Engine::run(const std::atomic<bool>& stop, const std::function<double()>& clock,
                 const std::function<void(const TickReport&)>& on_report) {
  using steady = std::chrono::steady_clock;
  const auto period = std::chrono::duration_cast<steady::duration>(
    std::chrono::duration<double>(cfg_.tick_period_s));

  AISLEGUARD_LOG(INFO, "engine") << "running, period " << cfg_.tick_period_s << " s, "
                                 << cfg_.worker_threads << " worker(s)";

  while (!stop.load()) {
    const auto started = steady::now();
    TickReport report = tick(clock());
    const auto finished = steady::now();

    const bool overran = (finished - started) > period;
    if (overran) {
      double ms = std::chrono::duration<double, std::milli>(finished - started).count();
      AISLEGUARD_LOG(WARN, "engine") << "tick " << report.tick << " overran its period: "
                                     << ms << " ms";
      report.conditions.push_back({ConditionKind::TICK_OVERRUN, std::string(),
                                   std::to_string(ms) + " ms"});
    }

    if (on_report) on_report(report);

    // after an overrun the next tick starts at once with the current snapshot
    if (!overran) std::this_thread::sleep_until(started + period);
  }

  AISLEGUARD_LOG(INFO, "engine") << "stopped after " << tick_count_ << " ticks";
}

} // namespace guard
