#pragma once
#include <memory>
#include <string>
#include <vector>
#include "guard_core/publisher.hpp"
#include "site_env/config.hpp"
#include "site_env/entity.hpp"
#include "site_env/site.hpp"

namespace fixtures {

inline site::Polygon rect(double x0, double y0, double x1, double y1) {
  return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}

// M1: lit pedestrian way across x 10..14. M2: unlit way x 20..24.
// B1: bad-signal area x 30..40.
inline std::shared_ptr<const site::SiteMap> warehouse() {
  auto m = std::make_shared<site::SiteMap>();
  m->zones.push_back({"M1", site::ZoneKind::PEDESTRIAN_WAY, rect(10, -2, 14, 2), "LZ1"});
  m->zones.push_back({"M2", site::ZoneKind::PEDESTRIAN_WAY, rect(20, -2, 24, 2), ""});
  m->zones.push_back({"B1", site::ZoneKind::BAD_SIGNAL, rect(30, -5, 40, 5), ""});
  return m;
}

inline site::ThresholdConfig bands(double prox, double warn, double brake, double mult = 1.0) {
  site::ThresholdConfig c;
  c.proximity_m = prox;
  c.warning_m = warn;
  c.braking_m = brake;
  c.pedestrian_multiplier = mult;
  return c;
}

inline site::ThresholdTable table(double prox = 5.0, double warn = 3.0, double brake = 1.5,
                                  double mult = 2.0) {
  site::ThresholdTable t;
  t.defaults = bands(prox, warn, brake, mult);
  return t;
}

inline site::EntityState entity(const std::string& id, site::EntityKind kind, site::Vec2 pos,
                                site::Vec2 vel = {0.0, 0.0}) {
  site::EntityState e;
  e.id = id;
  e.kind = kind;
  e.pos = pos;
  e.vel = vel;
  if (vel.x != 0.0 || vel.y != 0.0) {
    e.heading = site::direction_of(vel);
    e.has_heading = true;
  }
  return e;
}

class RecordingTransport : public guard::Transport {
public:
  std::vector<guard::OutboundMessage> sent;
  void send(const guard::OutboundMessage& msg) override { sent.push_back(msg); }
};

} // namespace fixtures
