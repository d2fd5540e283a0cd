#include "guard_core/alert_fsm.hpp"

namespace guard {

static bool more_severe(AlertLevel a, AlertLevel b) {
  return static_cast<int>(a) > static_cast<int>(b);
}

void AlertFsm::step(const RiskAssessment* governing, double now, BrakeReason clear_reason,
                    CommandBatch& out) {
  const AlertLevel target = governing ? governing->level : AlertLevel::NONE;

  if (governing && governing->other_id == state.governing_id) {
    state.last_distance_m = governing->distance_m;
    state.last_bearing_deg = governing->bearing_deg;
  }

  // State transitions (deterministic)
  if (more_severe(target, state.level)) {
    enter(target, governing, now, clear_reason, out);
    return;
  }

  if (target == state.level) {
    state.debounce_count = 0;
    state.pending = state.level;
    if (governing && governing->other_id != state.governing_id) {
      state.governing_id = governing->other_id;
      state.last_distance_m = governing->distance_m;
      state.last_bearing_deg = governing->bearing_deg;
    }
    return;
  }

  // below the current level: hold until the streak is long enough
  const bool same_contact = governing && target == state.pending &&
                            governing->other_id == state.pending_contact.other_id;
  if (state.debounce_count == 0 || more_severe(target, state.pending) || same_contact) {
    state.pending = target;
    state.pending_contact = governing ? *governing : RiskAssessment();
  }
  state.debounce_count += 1;
  if (state.debounce_count >= cfg.debounce_ticks) {
    const RiskAssessment contact = state.pending_contact;
    enter(state.pending, (state.pending == AlertLevel::NONE) ? nullptr : &contact, now,
          clear_reason, out);
  }
}

void AlertFsm::enter(AlertLevel next, const RiskAssessment* governing, double now,
                     BrakeReason clear_reason, CommandBatch& out) {
  const AlertLevel prev = state.level;

  state.level = next;
  state.entered_t = now;
  state.debounce_count = 0;
  state.pending = next;

  if (next == AlertLevel::NONE) {
    state.governing_id.clear();
  } else if (governing) {
    state.governing_id = governing->other_id;
    state.last_distance_m = governing->distance_m;
    state.last_bearing_deg = governing->bearing_deg;
  }

  // release always goes out ahead of whatever follows it
  if (prev == AlertLevel::BRAKING) {
    out.brakes.push_back({vehicle_id, BrakeAction::RELEASE, clear_reason});
  }

  switch (next) {
    case AlertLevel::BRAKING: {
      BrakeReason why = (governing && governing->shared_zone_pedestrian)
                          ? BrakeReason::PEDESTRIAN_BRAKING_BAND
                          : BrakeReason::BRAKING_BAND;
      out.brakes.push_back({vehicle_id, BrakeAction::ENGAGE, why});
      break;
    }

    case AlertLevel::WARNING:
    case AlertLevel::PROXIMITY:
      out.alerts.push_back({vehicle_id, next, state.last_bearing_deg, state.last_distance_m,
                            state.governing_id});
      break;

    case AlertLevel::NONE:
    default:
      // clears the operator display
      out.alerts.push_back({vehicle_id, AlertLevel::NONE, 0.0, 0.0, std::string()});
      break;
  }
}

} // namespace guard
