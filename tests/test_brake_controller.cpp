#include <catch2/catch.hpp>
#include <stdexcept>
#include <vector>
#include "guard_core/brake_controller.hpp"
#include "guard_core/wire.hpp"

using namespace guard;

class RecordingActuator : public BrakeActuator {
public:
  std::vector<bool> calls;
  void set_engaged(bool engaged) override { calls.push_back(engaged); }
};

static CommandBatch brake(const std::string& vehicle, BrakeAction action) {
  CommandBatch b;
  b.brakes.push_back({vehicle, action, BrakeReason::BRAKING_BAND});
  return b;
}

static CommandBatch heartbeat(const std::string& vehicle) {
  CommandBatch b;
  b.heartbeats.push_back({vehicle, 1});
  return b;
}

static const BrakeControllerConfig kCfg{"FL-1", 0.5};

TEST_CASE("Controller starts released and validates its config", "[brake]")
{
  RecordingActuator act;
  BrakeController ctl(kCfg, act, 0.0);
  REQUIRE(ctl.state() == BrakeState::RELEASED);
  REQUIRE(act.calls == std::vector<bool>{false});

  REQUIRE_THROWS_AS(BrakeController(BrakeControllerConfig{"", 0.5}, act, 0.0), std::invalid_argument);
  REQUIRE_THROWS_AS(BrakeController(BrakeControllerConfig{"FL-1", 0.0}, act, 0.0), std::invalid_argument);
}

TEST_CASE("Engage and release are idempotent", "[brake]")
{
  RecordingActuator act;
  BrakeController ctl(kCfg, act, 0.0);

  ctl.on_batch(brake("FL-1", BrakeAction::ENGAGE), 0.1);
  ctl.on_batch(brake("FL-1", BrakeAction::ENGAGE), 0.2);
  REQUIRE(ctl.state() == BrakeState::ENGAGED);

  ctl.on_batch(brake("FL-1", BrakeAction::RELEASE), 0.3);
  ctl.on_batch(brake("FL-1", BrakeAction::RELEASE), 0.4);
  REQUIRE(ctl.state() == BrakeState::RELEASED);

  REQUIRE(act.calls == std::vector<bool>{false, true, false});
}

TEST_CASE("Silence engages the brake from any state", "[brake]")
{
  RecordingActuator act;
  BrakeController ctl(kCfg, act, 0.0);

  SECTION("from released") {
    REQUIRE(ctl.tick(0.5) == BrakeState::RELEASED);
    REQUIRE(ctl.tick(0.6) == BrakeState::FAILSAFE_ENGAGED);
    REQUIRE(act.calls.back() == true);
  }

  SECTION("from engaged, without touching the actuator again") {
    ctl.on_batch(brake("FL-1", BrakeAction::ENGAGE), 0.1);
    REQUIRE(act.calls.size() == 2);
    REQUIRE(ctl.tick(0.7) == BrakeState::FAILSAFE_ENGAGED);
    REQUIRE(act.calls.size() == 2);
  }
}

TEST_CASE("Fail-safe ends only on an explicit release", "[brake]")
{
  RecordingActuator act;
  BrakeController ctl(kCfg, act, 0.0);
  ctl.on_batch(brake("FL-1", BrakeAction::RELEASE), 0.1);
  REQUIRE(ctl.tick(0.7) == BrakeState::FAILSAFE_ENGAGED);

  // link back, but the last release predates the fail-safe
  ctl.on_batch(heartbeat("FL-1"), 0.8);
  REQUIRE(ctl.tick(0.9) == BrakeState::FAILSAFE_ENGAGED);

  ctl.on_batch(brake("FL-1", BrakeAction::RELEASE), 1.0);
  REQUIRE(ctl.state() == BrakeState::RELEASED);
  REQUIRE(act.calls.back() == false);
}

TEST_CASE("Engage after fail-safe keeps the brake on", "[brake]")
{
  RecordingActuator act;
  BrakeController ctl(kCfg, act, 0.0);
  REQUIRE(ctl.tick(1.0) == BrakeState::FAILSAFE_ENGAGED);
  const std::size_t calls = act.calls.size();

  ctl.on_batch(brake("FL-1", BrakeAction::ENGAGE), 1.1);
  REQUIRE(ctl.state() == BrakeState::ENGAGED);
  REQUIRE(act.calls.size() == calls);
}

TEST_CASE("Only well-formed messages for this vehicle count as liveness", "[brake]")
{
  RecordingActuator act;
  BrakeController ctl(kCfg, act, 0.0);

  ctl.on_payload("{\"commands\": [", 0.4);
  ctl.on_payload(encode(heartbeat("FL-9")), 0.4);
  REQUIRE(ctl.last_message_t() == 0.0);
  REQUIRE(ctl.tick(0.6) == BrakeState::FAILSAFE_ENGAGED);
}

TEST_CASE("Commands for other vehicles are ignored", "[brake]")
{
  RecordingActuator act;
  BrakeController ctl(kCfg, act, 0.0);
  ctl.on_payload(encode(brake("FL-2", BrakeAction::ENGAGE)), 0.1);
  REQUIRE(ctl.state() == BrakeState::RELEASED);
  REQUIRE(act.calls.size() == 1);
}

TEST_CASE("Late delivery does not move liveness backwards", "[brake]")
{
  RecordingActuator act;
  BrakeController ctl(kCfg, act, 0.0);
  ctl.on_payload(encode(heartbeat("FL-1")), 0.4);
  ctl.on_payload(encode(heartbeat("FL-1")), 0.2);
  REQUIRE(ctl.last_message_t() == 0.4);
  REQUIRE(ctl.tick(0.8) == BrakeState::RELEASED);
}
