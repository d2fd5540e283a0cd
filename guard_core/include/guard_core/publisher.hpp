#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "guard_core/commands.hpp"

namespace guard {

enum class DestinationKind { VEHICLE=0, LIGHT_CONTROLLER=1 };

const char* destination_kind_name(DestinationKind k);

struct Destination {
  DestinationKind kind = DestinationKind::VEHICLE;
  std::string id;

  bool operator<(const Destination& o) const;
  bool operator==(const Destination& o) const;
};

// Lower value is sent first.
static constexpr int kBrakePriority = 0;
static constexpr int kDefaultPriority = 1;

struct OutboundMessage {
  Destination dest;
  int priority = kDefaultPriority;
  std::string payload;
};

// Publish-subscribe bus seam. Delivery and retries belong to the implementation.
class Transport {
public:
  virtual ~Transport() = default;
  virtual void send(const OutboundMessage& msg) = 0;
};

// Writes one line per message: "<kind>:<id> p<priority> <payload>".
class StreamTransport : public Transport {
public:
  explicit StreamTransport(std::ostream& out) : out_(out) {}
  void send(const OutboundMessage& msg) override;

private:
  std::ostream& out_;
};

class CommandPublisher {
public:
  explicit CommandPublisher(Transport& transport) : transport_(transport) {}

  // Brake commands become single-command messages at brake priority, in batch
  // order. Everything else is grouped per destination. Zone alerts go to the
  // vehicle and, when the zone has one, to its light-controller target.
  static std::vector<OutboundMessage> frame(const CommandBatch& batch);

  // Frames and hands every message to the transport once. Returns the number
  // the transport accepted; failures are logged.
  std::size_t publish(const CommandBatch& batch);

private:
  Transport& transport_;
};

} // namespace guard
