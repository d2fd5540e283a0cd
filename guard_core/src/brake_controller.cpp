#include "guard_core/brake_controller.hpp"
#include <stdexcept>
#include "guard_core/wire.hpp"
#include "site_env/log.hpp"

namespace guard {

const char* brake_state_name(BrakeState s) {
  switch (s) {
    case BrakeState::RELEASED: return "RELEASED";
    case BrakeState::ENGAGED: return "ENGAGED";
    case BrakeState::FAILSAFE_ENGAGED: return "FAILSAFE_ENGAGED";
  }
  return "UNKNOWN";
}

BrakeController::BrakeController(BrakeControllerConfig cfg, BrakeActuator& actuator, double start_t)
  : cfg_(std::move(cfg)), actuator_(actuator), last_rx_t_(start_t) {
  if (cfg_.vehicle_id.empty()) throw std::invalid_argument("BrakeController: vehicle id is required");
  if (!(cfg_.failsafe_timeout_s > 0.0))
    throw std::invalid_argument("BrakeController: fail-safe timeout must be > 0");
  actuator_.set_engaged(false);
}

void BrakeController::on_payload(const std::string& payload, double now) {
  CommandBatch batch;
  try {
    batch = decode(payload);
  } catch (const std::runtime_error& e) {
    AISLEGUARD_LOG(WARN, "brake") << cfg_.vehicle_id << ": dropped payload, " << e.what();
    return;
  }
  on_batch(batch, now);
}

void BrakeController::on_batch(const CommandBatch& batch, double now) {
  const std::string& me = cfg_.vehicle_id;

  bool mine = false;
  for (const auto& b : batch.brakes) mine = mine || b.vehicle_id == me;
  for (const auto& a : batch.alerts) mine = mine || a.vehicle_id == me;
  for (const auto& z : batch.zone_alerts) mine = mine || z.vehicle_id == me;
  for (const auto& h : batch.heartbeats) mine = mine || h.vehicle_id == me;
  if (!mine) {
    AISLEGUARD_LOG(DEBUG, "brake") << me << ": ignoring message for another destination";
    return;
  }

  // liveness only moves forward
  double prev = last_rx_t_.load();
  while (now > prev && !last_rx_t_.compare_exchange_weak(prev, now)) {
  }

  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto& b : batch.brakes) {
    if (b.vehicle_id != me) continue;
    commanded_engaged_ = (b.action == BrakeAction::ENGAGE);
    if (state_ == BrakeState::FAILSAFE_ENGAGED) released_since_failsafe_ = !commanded_engaged_;
  }
  resolve(now);
}

BrakeState BrakeController::tick(double now) {
  std::lock_guard<std::mutex> lock(mtx_);
  resolve(now);
  return state_;
}

BrakeState BrakeController::state() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_;
}

bool BrakeController::alive(double now) const {
  return (now - last_rx_t_.load()) <= cfg_.failsafe_timeout_s;
}

void BrakeController::resolve(double now) {
  if (!alive(now)) {
    if (state_ != BrakeState::FAILSAFE_ENGAGED) {
      AISLEGUARD_LOG(WARN, "brake") << cfg_.vehicle_id << ": link silent for "
                                    << (now - last_rx_t_.load()) << " s, fail-safe brake";
      released_since_failsafe_ = false;
      apply(BrakeState::FAILSAFE_ENGAGED);
    }
    return;
  }

  if (state_ == BrakeState::FAILSAFE_ENGAGED) {
    // fail-safe outranks an old release; only a fresh one ends it
    if (commanded_engaged_) apply(BrakeState::ENGAGED);
    else if (released_since_failsafe_) apply(BrakeState::RELEASED);
    return;
  }

  apply(commanded_engaged_ ? BrakeState::ENGAGED : BrakeState::RELEASED);
}

void BrakeController::apply(BrakeState next) {
  if (next == state_) return;

  const bool was_engaged = state_ != BrakeState::RELEASED;
  const bool engaged = next != BrakeState::RELEASED;
  AISLEGUARD_LOG(INFO, "brake") << cfg_.vehicle_id << ": " << brake_state_name(state_)
                                << " -> " << brake_state_name(next);
  state_ = next;
  if (engaged != was_engaged) actuator_.set_engaged(engaged);
}

} // namespace guard
