#include "site_env/scenario.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "site_env/log.hpp"

namespace site {

static std::string read_file(const std::string& path, const char* what) {
  std::ifstream f(path);
  if (!f) throw std::runtime_error(std::string("Failed to open ") + what + ": " + path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

static nlohmann::json parse_json(const std::string& text, const std::string& source) {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(source + ": " + e.what());
  }
}

static Vec2 read_point(const nlohmann::json& p) {
  if (!p.is_array() || p.size() != 2) throw std::runtime_error("point must be [x, y]");
  return {p.at(0).get<double>(), p.at(1).get<double>()};
}

static ThresholdConfig read_thresholds(const nlohmann::json& t) {
  ThresholdConfig c;
  c.vehicle_id = t.value("vehicleId", std::string());
  c.proximity_m = t.at("proximityDistance").get<double>();
  c.warning_m = t.at("warningDistance").get<double>();
  c.braking_m = t.at("brakingDistance").get<double>();
  c.pedestrian_multiplier = t.value("pedestrianZoneBandMultiplier", 1.0);

  std::string why;
  if (!validate(c, &why)) {
    std::string who = c.vehicle_id.empty() ? "defaults" : c.vehicle_id;
    throw std::runtime_error("thresholds for " + who + ": " + why);
  }
  return c;
}

static ThresholdTable read_threshold_table(const nlohmann::json& j) {
  ThresholdTable table;
  table.version = j.value("version", 0);
  table.defaults = read_thresholds(j.at("defaults"));
  table.defaults.vehicle_id.clear();

  if (j.contains("vehicles")) {
    for (auto& v : j.at("vehicles")) {
      ThresholdConfig c = read_thresholds(v);
      if (c.vehicle_id.empty()) throw std::runtime_error("threshold entry without vehicleId");
      if (!table.vehicles.emplace(c.vehicle_id, c).second)
        throw std::runtime_error("duplicate thresholds for " + c.vehicle_id);
    }
  }
  return table;
}

static EngineConfig read_engine(const nlohmann::json& e) {
  EngineConfig c;
  c.tick_period_s = e.value("tick_period_s", c.tick_period_s);
  // no safe universal values exist for these three, the site must state them
  c.liveness_window_s = e.at("liveness_window_s").get<double>();
  c.debounce_ticks = e.at("debounce_ticks").get<int>();
  c.lookahead_s = e.at("lookahead_s").get<double>();
  c.jitter_filter_m = e.value("jitter_filter_m", c.jitter_filter_m);
  c.worker_threads = e.value("worker_threads", c.worker_threads);
  c.heartbeat_every_ticks = e.value("heartbeat_every_ticks", c.heartbeat_every_ticks);
  c.brake_reassert_every_ticks = e.value("brake_reassert_every_ticks", c.brake_reassert_every_ticks);
  c.vehicle_failsafe_timeout_s = e.value("vehicle_failsafe_timeout_s", c.vehicle_failsafe_timeout_s);

  std::string why;
  if (!validate(c, &why)) throw std::runtime_error("engine: " + why);
  return c;
}

static SiteMap read_site(const nlohmann::json& j) {
  SiteMap m;
  if (!j.contains("zones")) return m;

  for (auto& z : j.at("zones")) {
    Zone zone;
    zone.id = z.at("id").get<std::string>();
    std::string kind = z.value("kind", std::string("pedestrian_way"));
    if (!parse_zone_kind(kind, zone.kind))
      throw std::runtime_error("zone " + zone.id + ": unknown kind '" + kind + "'");
    for (auto& p : z.at("polygon")) zone.area.push_back(read_point(p));
    if (zone.area.size() < 3)
      throw std::runtime_error("zone " + zone.id + ": polygon needs at least 3 points");
    zone.light_target = z.value("light_target", std::string());
    if (m.find(zone.id)) throw std::runtime_error("duplicate zone " + zone.id);
    m.zones.push_back(zone);
  }
  return m;
}

SiteConfig Scenario::parse_site(const std::string& text) {
  nlohmann::json j = parse_json(text, "site");
  try {
    SiteConfig cfg;
    cfg.engine = read_engine(j.at("engine"));
    cfg.site = read_site(j);
    cfg.thresholds = read_threshold_table(j.at("thresholds"));
    return cfg;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("site: ") + e.what());
  }
}

SiteConfig Scenario::load_site_file(const std::string& path) {
  std::string text = read_file(path, "site");
  try {
    return parse_site(text);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

ThresholdTable Scenario::load_thresholds_file(const std::string& path) {
  nlohmann::json j = parse_json(read_file(path, "site"), path);
  try {
    return read_threshold_table(j.at("thresholds"));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(path + ": " + e.what());
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

Feed Scenario::parse_feed(const std::string& text) {
  nlohmann::json j = parse_json(text, "feed");
  Feed feed;
  try {
    for (auto& f : j.at("fixes")) {
      PositionFix fix;
      fix.entity_id = f.at("entityId").get<std::string>();
      std::string kind = f.at("kind").get<std::string>();
      if (!parse_kind(kind, fix.kind))
        throw std::runtime_error("fix for " + fix.entity_id + ": unknown kind '" + kind + "'");
      fix.pos = {f.at("x").get<double>(), f.at("y").get<double>()};
      fix.t = f.at("timestamp").get<double>();
      feed.fixes.push_back(fix);
    }

    if (j.contains("link_loss")) {
      for (auto& l : j.at("link_loss")) {
        LinkLoss loss;
        loss.vehicle_id = l.at("vehicleId").get<std::string>();
        loss.from_t = l.at("from").get<double>();
        loss.to_t = l.at("to").get<double>();
        feed.link_loss.push_back(loss);
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("feed: ") + e.what());
  }

  std::stable_sort(feed.fixes.begin(), feed.fixes.end(),
                   [](const PositionFix& a, const PositionFix& b) { return a.t < b.t; });
  return feed;
}

Feed Scenario::load_feed_file(const std::string& path) {
  std::string text = read_file(path, "feed");
  try {
    return parse_feed(text);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

double Feed::start_t() const { return fixes.empty() ? 0.0 : fixes.front().t; }
double Feed::end_t() const { return fixes.empty() ? 0.0 : fixes.back().t; }

std::size_t Feed::replay_into(EntityRegistry& reg, std::size_t& cursor, double until) const {
  std::size_t rejected = 0;
  while (cursor < fixes.size() && fixes[cursor].t <= until) {
    const PositionFix& f = fixes[cursor];
    FixStatus st = reg.upsert(f);
    if (st != FixStatus::ACCEPTED) {
      ++rejected;
      AISLEGUARD_LOG(DEBUG, "feed") << kind_name(f.kind) << " " << f.entity_id << " fix at t="
                                    << f.t << " rejected: " << fix_status_name(st);
    }
    ++cursor;
  }
  return rejected;
}

bool Feed::link_down(const std::string& vehicle_id, double t) const {
  for (const auto& l : link_loss) {
    if (l.vehicle_id == vehicle_id && t >= l.from_t && t < l.to_t) return true;
  }
  return false;
}

} // namespace site
