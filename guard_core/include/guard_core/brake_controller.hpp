#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include "guard_core/commands.hpp"

namespace guard {

enum class BrakeState { RELEASED=0, ENGAGED=1, FAILSAFE_ENGAGED=2 };

const char* brake_state_name(BrakeState s);

// Physical brake driver seam.
class BrakeActuator {
public:
  virtual ~BrakeActuator() = default;
  virtual void set_engaged(bool engaged) = 0;
};

struct BrakeControllerConfig {
  std::string vehicle_id;
  double failsafe_timeout_s = 0.0; // silence longer than this engages the brake
};

// Runs on the vehicle. Engage/release are level-set, so duplicates are
// harmless. A liveness watchdog overrides everything: when the link has been
// silent for longer than the timeout the brake engages, and it stays engaged
// until the link is back and an explicit release has arrived.
//
// on_payload/on_batch may be called from a receive thread while tick() runs
// on the control loop.
class BrakeController {
public:
  BrakeController(BrakeControllerConfig cfg, BrakeActuator& actuator, double start_t);

  // Decodes a bus payload. Malformed payloads, or ones with nothing for this
  // vehicle, are logged and ignored and do not count as liveness.
  void on_payload(const std::string& payload, double now);

  // Commands addressed elsewhere are skipped.
  void on_batch(const CommandBatch& batch, double now);

  BrakeState tick(double now);

  BrakeState state() const;
  double last_message_t() const { return last_rx_t_.load(); }
  const std::string& vehicle_id() const { return cfg_.vehicle_id; }

private:
  bool alive(double now) const;
  void resolve(double now);          // mtx_ held
  void apply(BrakeState next);       // mtx_ held

  BrakeControllerConfig cfg_;
  BrakeActuator& actuator_;
  std::atomic<double> last_rx_t_;

  mutable std::mutex mtx_;
  BrakeState state_ = BrakeState::RELEASED;
  bool commanded_engaged_ = false;
  bool released_since_failsafe_ = false;
};

} // namespace guard
