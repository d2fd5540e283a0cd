#pragma once
#include <string>
#include "guard_core/commands.hpp"
#include "guard_core/proximity.hpp"

namespace guard {

struct AlertState {
  AlertLevel level = AlertLevel::NONE;
  std::string governing_id;   // empty at NONE
  double entered_t = 0.0;     // when `level` was entered

  // De-escalation hysteresis: consecutive ticks below `level`, the most
  // severe lower level seen during that streak and the assessment behind it.
  int debounce_count = 0;
  AlertLevel pending = AlertLevel::NONE;
  RiskAssessment pending_contact;

  // Last geometry reported by the governing entity, for alerts issued while
  // it is no longer a candidate.
  double last_distance_m = 0.0;
  double last_bearing_deg = 0.0;
};

struct AlertFsmConfig {
  int debounce_ticks = 1;
};

// One per vehicle. Escalates immediately, de-escalates only after the lower
// level has held for cfg.debounce_ticks consecutive steps.
class AlertFsm {
public:
  std::string vehicle_id;
  AlertState state;
  AlertFsmConfig cfg;

  // `governing` is null when no candidate is above NONE. `clear_reason` is the
  // brake-release reason used if this step leaves BRAKING.
  void step(const RiskAssessment* governing, double now, BrakeReason clear_reason, CommandBatch& out);

private:
  void enter(AlertLevel next, const RiskAssessment* governing, double now,
             BrakeReason clear_reason, CommandBatch& out);
};

} // namespace guard
