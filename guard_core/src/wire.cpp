#include "guard_core/wire.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace guard {

using nlohmann::json;

void to_json(json& j, const AlertCommand& c) {
  j = json{{"type", "alert"},
           {"vehicleId", c.vehicle_id},
           {"level", level_name(c.level)},
           {"bearing", c.bearing_deg},
           {"distance", c.distance_m},
           {"governingEntityId", c.governing_id}};
}

void to_json(json& j, const BrakeCommand& c) {
  j = json{{"type", "brake"},
           {"vehicleId", c.vehicle_id},
           {"action", action_name(c.action)},
           {"reasonCode", reason_name(c.reason)}};
}

void to_json(json& j, const ZoneAlertCommand& c) {
  j = json{{"type", "zone_alert"},
           {"vehicleId", c.vehicle_id},
           {"zoneId", c.zone_id},
           {"lightControllerTarget", c.light_target}};
}

void to_json(json& j, const ZoneClearCommand& c) {
  j = json{{"type", "zone_clear"},
           {"zoneId", c.zone_id},
           {"lightControllerTarget", c.light_target}};
}

void to_json(json& j, const HeartbeatCommand& c) {
  j = json{{"type", "heartbeat"}, {"vehicleId", c.vehicle_id}, {"tick", c.tick}};
}

void from_json(const json& j, AlertCommand& c) {
  j.at("vehicleId").get_to(c.vehicle_id);
  std::string level = j.at("level").get<std::string>();
  if (!parse_level(level, c.level)) throw std::runtime_error("unknown alert level '" + level + "'");
  j.at("bearing").get_to(c.bearing_deg);
  j.at("distance").get_to(c.distance_m);
  c.governing_id = j.value("governingEntityId", std::string());
}

void from_json(const json& j, BrakeCommand& c) {
  j.at("vehicleId").get_to(c.vehicle_id);
  std::string action = j.at("action").get<std::string>();
  if (!parse_action(action, c.action)) throw std::runtime_error("unknown brake action '" + action + "'");
  std::string reason = j.at("reasonCode").get<std::string>();
  if (!parse_reason(reason, c.reason)) throw std::runtime_error("unknown reason code '" + reason + "'");
}

void from_json(const json& j, ZoneAlertCommand& c) {
  j.at("vehicleId").get_to(c.vehicle_id);
  j.at("zoneId").get_to(c.zone_id);
  c.light_target = j.value("lightControllerTarget", std::string());
}

void from_json(const json& j, ZoneClearCommand& c) {
  j.at("zoneId").get_to(c.zone_id);
  c.light_target = j.value("lightControllerTarget", std::string());
}

void from_json(const json& j, HeartbeatCommand& c) {
  j.at("vehicleId").get_to(c.vehicle_id);
  j.at("tick").get_to(c.tick);
}

std::string encode(const CommandBatch& batch) {
  json cmds = json::array();
  for (const auto& c : batch.brakes) cmds.push_back(json(c));
  for (const auto& c : batch.alerts) cmds.push_back(json(c));
  for (const auto& c : batch.zone_alerts) cmds.push_back(json(c));
  for (const auto& c : batch.zone_clears) cmds.push_back(json(c));
  for (const auto& c : batch.heartbeats) cmds.push_back(json(c));
  return json{{"commands", cmds}}.dump();
}

CommandBatch decode(const std::string& payload) {
  CommandBatch batch;
  try {
    json j = json::parse(payload);
    for (const auto& c : j.at("commands")) {
      const std::string type = c.at("type").get<std::string>();
      if (type == "brake") batch.brakes.push_back(c.get<BrakeCommand>());
      else if (type == "alert") batch.alerts.push_back(c.get<AlertCommand>());
      else if (type == "zone_alert") batch.zone_alerts.push_back(c.get<ZoneAlertCommand>());
      else if (type == "zone_clear") batch.zone_clears.push_back(c.get<ZoneClearCommand>());
      else if (type == "heartbeat") batch.heartbeats.push_back(c.get<HeartbeatCommand>());
      else throw std::runtime_error("unknown command type '" + type + "'");
    }
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("malformed payload: ") + e.what());
  }
  return batch;
}

} // namespace guard
