#include "guard_core/publisher.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include "guard_core/wire.hpp"
#include "site_env/log.hpp"

namespace guard {

const char* destination_kind_name(DestinationKind k) {
  switch (k) {
    case DestinationKind::VEHICLE: return "vehicle";
    case DestinationKind::LIGHT_CONTROLLER: return "lights";
  }
  return "unknown";
}

bool Destination::operator<(const Destination& o) const {
  if (kind != o.kind) return static_cast<int>(kind) < static_cast<int>(o.kind);
  return id < o.id;
}

bool Destination::operator==(const Destination& o) const {
  return kind == o.kind && id == o.id;
}

void StreamTransport::send(const OutboundMessage& msg) {
  out_ << destination_kind_name(msg.dest.kind) << ":" << msg.dest.id
       << " p" << msg.priority << " " << msg.payload << "\n";
}

std::vector<OutboundMessage> CommandPublisher::frame(const CommandBatch& batch) {
  std::vector<OutboundMessage> out;

  // never coalesced
  for (const auto& b : batch.brakes) {
    CommandBatch single;
    single.brakes.push_back(b);
    out.push_back({{DestinationKind::VEHICLE, b.vehicle_id}, kBrakePriority, encode(single)});
  }

  std::map<Destination, CommandBatch> grouped;
  for (const auto& a : batch.alerts) {
    grouped[{DestinationKind::VEHICLE, a.vehicle_id}].alerts.push_back(a);
  }
  for (const auto& z : batch.zone_alerts) {
    grouped[{DestinationKind::VEHICLE, z.vehicle_id}].zone_alerts.push_back(z);
    if (!z.light_target.empty())
      grouped[{DestinationKind::LIGHT_CONTROLLER, z.light_target}].zone_alerts.push_back(z);
  }
  for (const auto& z : batch.zone_clears) {
    grouped[{DestinationKind::LIGHT_CONTROLLER, z.light_target}].zone_clears.push_back(z);
  }
  for (const auto& h : batch.heartbeats) {
    grouped[{DestinationKind::VEHICLE, h.vehicle_id}].heartbeats.push_back(h);
  }

  for (const auto& kv : grouped) {
    out.push_back({kv.first, kDefaultPriority, encode(kv.second)});
  }

  std::stable_sort(out.begin(), out.end(), [](const OutboundMessage& a, const OutboundMessage& b) {
    return a.priority < b.priority;
  });
  return out;
}

std::size_t CommandPublisher::publish(const CommandBatch& batch) {
  std::size_t sent = 0;
  for (const auto& msg : frame(batch)) {
    try {
      transport_.send(msg);
      ++sent;
    } catch (const std::exception& e) {
      // retries belong to the transport
      AISLEGUARD_LOG(ERROR, "publisher") << "send to " << destination_kind_name(msg.dest.kind)
                                         << ":" << msg.dest.id << " failed: " << e.what();
    }
  }
  return sent;
}

} // namespace guard
