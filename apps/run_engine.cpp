#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "guard_core/brake_controller.hpp"
#include "guard_core/engine.hpp"
#include "site_env/log.hpp"
#include "site_env/scenario.hpp"

// Stand-in for the brake driver on a simulated vehicle.
class SimActuator : public guard::BrakeActuator {
public:
  bool engaged = false;
  int changes = 0;
  void set_engaged(bool e) override {
    engaged = e;
    ++changes;
  }
};

struct SimVehicle {
  SimActuator actuator;
  std::unique_ptr<guard::BrakeController> controller;
  guard::BrakeState last = guard::BrakeState::RELEASED;
};

// In-process bus: vehicle messages reach the simulated controllers unless the
// feed says that vehicle's link is down; light-controller messages are printed.
class LoopbackTransport : public guard::Transport {
public:
  explicit LoopbackTransport(const site::Feed& feed) : feed_(feed) {}

  double now = 0.0;
  std::map<std::string, std::unique_ptr<SimVehicle>> vehicles;
  std::size_t delivered = 0;
  std::size_t dropped = 0;

  void send(const guard::OutboundMessage& msg) override {
    if (msg.dest.kind == guard::DestinationKind::LIGHT_CONTROLLER) {
      std::cout << std::fixed << std::setprecision(2)
                << "t=" << now << " lights:" << msg.dest.id << " " << msg.payload << "\n";
      return;
    }
    auto it = vehicles.find(msg.dest.id);
    if (it == vehicles.end()) return;
    if (feed_.link_down(msg.dest.id, now)) {
      ++dropped;
      return;
    }
    it->second->controller->on_payload(msg.payload, now);
    ++delivered;
  }

private:
  const site::Feed& feed_;
};

static void usage() {
  std::cerr << "Usage: run_engine <site.json> <feed.json> [--watch] [--log-level LEVEL]\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    usage();
    return 1;
  }
  const std::string site_path = argv[1];
  const std::string feed_path = argv[2];

  bool watch = false;
  for (int i = 3; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--watch") { watch = true; continue; }
    if (arg == "--log-level" && i + 1 < argc) {
      site::LogLevel level;
      if (!site::parse_log_level(argv[++i], level)) {
        std::cerr << "Unknown log level: " << argv[i] << "\n";
        return 1;
      }
      site::set_log_level(level);
      continue;
    }
    std::cerr << "Unknown arg: " << arg << "\n";
    usage();
    return 1;
  }

  site::SiteConfig cfg;
  site::Feed feed;
  try {
    cfg = site::Scenario::load_site_file(site_path);
    feed = site::Scenario::load_feed_file(feed_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  auto site_map = std::make_shared<const site::SiteMap>(cfg.site);
  LoopbackTransport bus(feed);
  guard::Engine engine(cfg.engine, site_map, cfg.thresholds, bus);

  const bool simulate_vehicles = cfg.engine.vehicle_failsafe_timeout_s > 0.0;
  if (!simulate_vehicles) {
    std::cout << "vehicle_failsafe_timeout_s not set: vehicle brake simulation off\n";
  }

  std::error_code ec;
  auto site_mtime = std::filesystem::last_write_time(site_path, ec);

  const double dt = cfg.engine.tick_period_s;
  // run on past the last fix long enough for everything to go stale and settle
  const double end_t = feed.end_t() + cfg.engine.liveness_window_s +
                       (cfg.engine.debounce_ticks + 1) * dt;

  for (const auto& z : site_map->zones) {
    AISLEGUARD_LOG(INFO, "run_engine") << "zone " << z.id << " " << site::zone_kind_name(z.kind)
                                       << (z.light_target.empty() ? "" : " lights ")
                                       << z.light_target;
  }

  std::cout << "Replaying " << feed.fixes.size() << " fixes from " << feed_path
            << " against " << site_path << "\n";

  std::map<std::string, guard::AlertLevel> last_level;
  std::map<std::string, std::size_t> condition_counts;
  std::size_t cursor = 0;
  std::size_t rejected = 0;
  std::size_t messages = 0;
  std::uint64_t ticks = 0;

  for (double t = feed.start_t(); t <= end_t; t += dt) {
    const std::size_t first = cursor;
    rejected += feed.replay_into(engine.registry(), cursor, t);

    if (simulate_vehicles) {
      for (std::size_t i = first; i < cursor; ++i) {
        const site::PositionFix& f = feed.fixes[i];
        if (f.kind != site::EntityKind::VEHICLE || bus.vehicles.count(f.entity_id)) continue;
        auto v = std::make_unique<SimVehicle>();
        guard::BrakeControllerConfig bc{f.entity_id, cfg.engine.vehicle_failsafe_timeout_s};
        v->controller = std::make_unique<guard::BrakeController>(bc, v->actuator, t);
        bus.vehicles.emplace(f.entity_id, std::move(v));
      }
    }

    if (watch) {
      auto mtime = std::filesystem::last_write_time(site_path, ec);
      if (!ec && mtime != site_mtime) {
        site_mtime = mtime;
        try {
          engine.thresholds().replace(site::Scenario::load_thresholds_file(site_path));
          AISLEGUARD_LOG(INFO, "run_engine") << "thresholds reloaded from " << site_path;
        } catch (const std::runtime_error& e) {
          AISLEGUARD_LOG(ERROR, "run_engine") << "reload failed, keeping previous thresholds: "
                                              << e.what();
        }
      }
    }

    bus.now = t;
    guard::TickReport report = engine.tick(t);
    messages += report.messages_sent;
    ++ticks;
    for (const auto& c : report.conditions) ++condition_counts[guard::condition_name(c.kind)];

    std::cout << std::fixed << std::setprecision(2);
    for (const auto& d : report.vehicles) {
      auto& prev = last_level[d.vehicle_id];
      if (prev == d.level) continue;
      prev = d.level;

      std::cout << "t=" << t << " " << d.vehicle_id << " " << guard::level_name(d.level);
      for (const auto& a : d.assessments) {
        if (a.other_id != d.governing_id) continue;
        std::cout << " gov=" << a.other_id
                  << " d=" << a.distance_m
                  << " closing=" << a.closing_speed
                  << " brg=" << a.bearing_deg;
      }
      std::cout << (d.live ? "" : "  [STALE]") << "\n";
    }

    for (auto& kv : bus.vehicles) {
      SimVehicle& v = *kv.second;
      guard::BrakeState s = v.controller->tick(t);
      if (s == v.last) continue;
      v.last = s;
      std::cout << "t=" << t << " " << kv.first << " brake " << guard::brake_state_name(s) << "\n";
    }
  }

  std::cout << "\nTicks: " << ticks
            << "  messages: " << messages
            << "  rejected fixes: " << rejected
            << "  dropped (link loss): " << bus.dropped << "\n";
  for (const auto& kv : condition_counts) {
    std::cout << "  " << kv.first << ": " << kv.second << " tick(s)\n";
  }
  for (const auto& kv : bus.vehicles) {
    std::cout << "  " << kv.first << " final brake "
              << guard::brake_state_name(kv.second->last)
              << " (" << kv.second->actuator.changes << " actuator changes)\n";
  }
  return 0;
}
