#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "guard_core/engine.hpp"
#include "site_env/scenario.hpp"

// CSV columns:
// feed,tick,t,vehicle,live,level,level_id,governing,distance,closing_speed,ttc,bearing,brake,messages

class CountingTransport : public guard::Transport {
public:
  std::size_t count = 0;
  void send(const guard::OutboundMessage&) override { ++count; }
};

static const char* brake_column(const guard::CommandBatch& cmds, const std::string& vehicle_id) {
  for (const auto& b : cmds.brakes) {
    if (b.vehicle_id == vehicle_id && b.reason != guard::BrakeReason::REASSERT)
      return guard::action_name(b.action);
  }
  return "";
}

int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "Usage: replay_to_csv <out.csv> <site.json> <feed1.json> [feed2.json ...]\n";
    return 1;
  }

  std::string out_path = argv[1];
  std::string site_path = argv[2];

  std::ofstream out(out_path);
  if (!out) {
    std::cerr << "Failed to open output: " << out_path << "\n";
    return 1;
  }

  site::SiteConfig cfg;
  try {
    cfg = site::Scenario::load_site_file(site_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
  auto site_map = std::make_shared<const site::SiteMap>(cfg.site);

  out << "feed,tick,t,vehicle,live,level,level_id,governing,distance,closing_speed,ttc,bearing,brake,messages\n";

  for (int i = 3; i < argc; ++i) {
    std::string feed_path = argv[i];

    site::Feed feed;
    try {
      feed = site::Scenario::load_feed_file(feed_path);
    } catch (const std::exception& e) {
      std::cerr << e.what() << "\n";
      return 2;
    }

    // fresh engine per feed so alert state does not leak between recordings
    CountingTransport bus;
    guard::Engine engine(cfg.engine, site_map, cfg.thresholds, bus);

    const double dt = cfg.engine.tick_period_s;
    const double end_t = feed.end_t() + cfg.engine.liveness_window_s +
                         (cfg.engine.debounce_ticks + 1) * dt;
    std::size_t cursor = 0;

    for (double t = feed.start_t(); t <= end_t; t += dt) {
      feed.replay_into(engine.registry(), cursor, t);
      guard::TickReport report = engine.tick(t);

      for (const auto& d : report.vehicles) {
        const guard::RiskAssessment* gov = nullptr;
        for (const auto& a : d.assessments) {
          if (a.other_id == d.governing_id) gov = &a;
        }

        out
          << feed_path << ","
          << report.tick << ","
          << t << ","
          << d.vehicle_id << ","
          << (d.live ? 1 : 0) << ","
          << guard::level_name(d.level) << ","
          << static_cast<int>(d.level) << ","
          << d.governing_id << ",";
        if (gov) {
          out << gov->distance_m << "," << gov->closing_speed << ",";
          if (gov->ttc_s == std::numeric_limits<double>::infinity()) out << "inf,";
          else out << gov->ttc_s << ",";
          out << gov->bearing_deg << ",";
        } else {
          out << ",,,,";
        }
        out << brake_column(report.commands, d.vehicle_id) << ","
            << report.messages_sent
            << "\n";
      }
    }

    std::cout << "Replayed: " << feed_path << " (" << engine.ticks() << " ticks, "
              << bus.count << " messages)\n";
  }

  std::cout << "Wrote dataset: " << out_path << "\n";
  return 0;
}
