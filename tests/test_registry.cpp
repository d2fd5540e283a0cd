#include <catch2/catch.hpp>
#include <atomic>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "fixtures.hpp"
#include "site_env/registry.hpp"

using namespace site;

static EntityRegistry make_registry(double jitter = 0.0) {
  return EntityRegistry(fixtures::warehouse(), RegistryConfig{1.0, jitter});
}

TEST_CASE("Registry rejects bad construction", "[registry]")
{
  REQUIRE_THROWS_AS(EntityRegistry(nullptr, RegistryConfig{1.0, 0.0}), std::invalid_argument);
  REQUIRE_THROWS_AS(EntityRegistry(fixtures::warehouse(), RegistryConfig{0.0, 0.0}),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(EntityRegistry(fixtures::warehouse(), RegistryConfig{1.0, -0.1}),
                    std::invalid_argument);
}

TEST_CASE("Out-of-order and duplicate timestamps are rejected", "[registry]")
{
  EntityRegistry reg = make_registry();
  REQUIRE(reg.upsert("FL-1", EntityKind::VEHICLE, {0.0, 0.0}, 5.0) == FixStatus::ACCEPTED);
  REQUIRE(reg.upsert("FL-1", EntityKind::VEHICLE, {1.0, 0.0}, 4.0) == FixStatus::STALE_TIMESTAMP);
  REQUIRE(reg.upsert("FL-1", EntityKind::VEHICLE, {1.0, 0.0}, 5.0) == FixStatus::STALE_TIMESTAMP);

  Snapshot snap = reg.snapshot(5.0);
  const EntityState* e = snap.find_live("FL-1");
  REQUIRE(e != nullptr);
  REQUIRE(e->pos.x == 0.0);
  REQUIRE(e->fixes == 1);
}

TEST_CASE("A fix cannot change an entity's kind", "[registry]")
{
  EntityRegistry reg = make_registry();
  REQUIRE(reg.upsert("P-1", EntityKind::PEDESTRIAN, {0.0, 0.0}, 0.0) == FixStatus::ACCEPTED);
  REQUIRE(reg.upsert("P-1", EntityKind::VEHICLE, {1.0, 0.0}, 1.0) == FixStatus::KIND_MISMATCH);
  REQUIRE(reg.snapshot(1.0).find_live("P-1")->kind == EntityKind::PEDESTRIAN);
}

TEST_CASE("Invalid fixes are rejected before registration", "[registry]")
{
  EntityRegistry reg = make_registry();
  const double nan = std::numeric_limits<double>::quiet_NaN();
  REQUIRE(reg.upsert("", EntityKind::VEHICLE, {0.0, 0.0}, 0.0) == FixStatus::INVALID_FIX);
  REQUIRE(reg.upsert("FL-1", EntityKind::VEHICLE, {nan, 0.0}, 0.0) == FixStatus::INVALID_FIX);
  REQUIRE(reg.upsert("FL-1", EntityKind::VEHICLE, {0.0, 0.0}, nan) == FixStatus::INVALID_FIX);
  REQUIRE(reg.size() == 0);
}

TEST_CASE("Velocity comes from consecutive fixes and heading survives a stop", "[registry]")
{
  EntityRegistry reg = make_registry();
  reg.upsert("FL-1", EntityKind::VEHICLE, {0.0, 0.0}, 0.0);
  REQUIRE_FALSE(reg.snapshot(0.0).find_live("FL-1")->has_heading);

  reg.upsert("FL-1", EntityKind::VEHICLE, {2.0, 0.0}, 1.0);
  Snapshot s1 = reg.snapshot(1.0);
  const EntityState* e = s1.find_live("FL-1");
  REQUIRE(e->vel.x == Approx(2.0));
  REQUIRE(e->vel.y == Approx(0.0));
  REQUIRE(e->has_heading);
  REQUIRE(e->heading == Approx(0.0));

  reg.upsert("FL-1", EntityKind::VEHICLE, {2.0, 0.0}, 2.0);
  Snapshot s2 = reg.snapshot(2.0);
  e = s2.find_live("FL-1");
  REQUIRE(e->vel.x == 0.0);
  REQUIRE(e->has_heading);
  REQUIRE(e->heading == Approx(0.0));
}

TEST_CASE("Jitter below the filter only refreshes liveness", "[registry]")
{
  EntityRegistry reg = make_registry(0.05);
  reg.upsert("P-1", EntityKind::PEDESTRIAN, {3.0, 3.0}, 0.0);
  REQUIRE(reg.upsert("P-1", EntityKind::PEDESTRIAN, {3.01, 3.0}, 1.0) == FixStatus::ACCEPTED);

  Snapshot snap = reg.snapshot(1.0);
  const EntityState* e = snap.find_live("P-1");
  REQUIRE(e->pos.x == 3.0);
  REQUIRE(e->vel.x == 0.0);
  REQUIRE(e->last_t == 1.0);
  REQUIRE_FALSE(e->has_heading);
}

TEST_CASE("Zones follow the latest position", "[registry]")
{
  EntityRegistry reg = make_registry();
  reg.upsert("FL-1", EntityKind::VEHICLE, {8.0, 0.0}, 0.0);
  REQUIRE(reg.snapshot(0.0).find_live("FL-1")->zones.empty());

  reg.upsert("FL-1", EntityKind::VEHICLE, {12.0, 0.0}, 1.0);
  Snapshot snap = reg.snapshot(1.0);
  REQUIRE(snap.find_live("FL-1")->in_zone("M1"));
  REQUIRE_FALSE(snap.find_live("FL-1")->in_zone("M2"));
}

TEST_CASE("Snapshot splits live from stale at the liveness window", "[registry]")
{
  EntityRegistry reg = make_registry();
  reg.upsert("FL-1", EntityKind::VEHICLE, {0.0, 0.0}, 0.0);
  reg.upsert("P-1", EntityKind::PEDESTRIAN, {1.0, 0.0}, 0.5);

  Snapshot edge = reg.snapshot(1.0);
  REQUIRE(edge.find_live("FL-1") != nullptr);
  REQUIRE(edge.find_live("P-1") != nullptr);

  Snapshot later = reg.snapshot(1.2);
  REQUIRE(later.find_live("FL-1") == nullptr);
  REQUIRE(later.is_stale("FL-1"));
  REQUIRE(later.find_live("P-1") != nullptr);
  REQUIRE_FALSE(later.is_stale("P-1"));
}

TEST_CASE("Snapshot is ordered by id", "[registry]")
{
  EntityRegistry reg = make_registry();
  reg.upsert("c", EntityKind::VEHICLE, {0.0, 0.0}, 0.0);
  reg.upsert("a", EntityKind::VEHICLE, {0.0, 0.0}, 0.0);
  reg.upsert("b", EntityKind::PEDESTRIAN, {0.0, 0.0}, 0.0);

  Snapshot snap = reg.snapshot(0.0);
  REQUIRE(snap.live.size() == 3);
  REQUIRE(snap.live[0].id == "a");
  REQUIRE(snap.live[1].id == "b");
  REQUIRE(snap.live[2].id == "c");
}

TEST_CASE("Deregistered entities disappear", "[registry]")
{
  EntityRegistry reg = make_registry();
  reg.upsert("FL-1", EntityKind::VEHICLE, {0.0, 0.0}, 0.0);
  REQUIRE(reg.deregister("FL-1"));
  REQUIRE_FALSE(reg.deregister("FL-1"));
  REQUIRE_FALSE(reg.contains("FL-1"));
  REQUIRE(reg.snapshot(0.0).live.empty());
}

TEST_CASE("Concurrent upserts for distinct entities are all applied", "[registry][concurrency]")
{
  EntityRegistry reg = make_registry();
  const int kThreads = 8;
  const int kFixes = 200;
  std::atomic<bool> done{false};
  std::atomic<bool> misordered{false};

  // assertions stay on the test thread
  std::thread reader([&] {
    while (!done.load()) {
      Snapshot snap = reg.snapshot(1000.0);
      for (std::size_t i = 1; i < snap.live.size(); ++i) {
        if (!(snap.live[i - 1].id < snap.live[i].id)) misordered = true;
      }
    }
  });

  std::vector<std::thread> writers;
  std::atomic<int> rejected{0};
  for (int w = 0; w < kThreads; ++w) {
    writers.emplace_back([&, w] {
      std::string id = "FL-" + std::to_string(w);
      for (int i = 0; i < kFixes; ++i) {
        if (reg.upsert(id, EntityKind::VEHICLE, {i * 0.5, w * 1.0}, i * 0.1) != FixStatus::ACCEPTED)
          ++rejected;
      }
    });
  }
  for (auto& t : writers) t.join();
  done = true;
  reader.join();

  REQUIRE(rejected.load() == 0);
  REQUIRE_FALSE(misordered.load());
  Snapshot snap = reg.snapshot(kFixes * 0.1);
  REQUIRE(snap.live.size() == static_cast<std::size_t>(kThreads));
  for (const auto& e : snap.live) REQUIRE(e.fixes == kFixes);
}
