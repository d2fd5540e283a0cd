#include <catch2/catch.hpp>
#include <sstream>
#include "site_env/log.hpp"

using namespace site;

TEST_CASE("Log lines carry level and component and respect the threshold", "[log]")
{
  std::ostringstream sink;
  const LogLevel saved = log_level();
  set_log_sink(&sink);
  set_log_level(LogLevel::WARN);

  AISLEGUARD_LOG(INFO, "engine") << "hidden";
  AISLEGUARD_LOG(WARN, "engine") << "tick " << 3 << " overran";

  set_log_sink(nullptr);
  set_log_level(saved);

  const std::string out = sink.str();
  REQUIRE(out.find("hidden") == std::string::npos);
  REQUIRE(out.find("WARN  engine: tick 3 overran") != std::string::npos);
}

TEST_CASE("Log levels parse in either case", "[log]")
{
  LogLevel l = LogLevel::INFO;
  REQUIRE(parse_log_level("debug", l));
  REQUIRE(l == LogLevel::DEBUG);
  REQUIRE(parse_log_level("ERROR", l));
  REQUIRE(l == LogLevel::ERROR);
  REQUIRE_FALSE(parse_log_level("verbose", l));
  REQUIRE_FALSE(log_enabled(LogLevel::OFF));
}
