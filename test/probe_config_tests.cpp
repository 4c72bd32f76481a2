#include <relay_probe/core/probe_config.hpp>

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace std::chrono_literals;

TEST_CASE("probe_config default values", "[core][config]")
{
  const relay_probe::core::probe_config config;

  CHECK(config.connect_timeout == 5000ms);
  CHECK(config.health_connect_timeout == 5000ms);
  CHECK(config.read_probe_wait == 1000ms);
  CHECK(config.publish_timeout == 10000ms);
  CHECK(config.metadata_timeout == 5000ms);
  CHECK(config.monitor_poll_interval == 100ms);
  CHECK(config.stress_max_hold == 1000ms);
  CHECK(config.default_relays.size() == 5);
  CHECK(config.default_relays.front() == "wss://relay.damus.io");
  CHECK_FALSE(config.verbose);
  CHECK(relay_probe::core::compliance_trials == 3);
}

TEST_CASE("parse_probe_config overrides only the keys present", "[core][config]")
{
  const auto config = relay_probe::core::parse_probe_config(
    R"({"publish_timeout_ms": 2500, "default_relays": ["ws://localhost:7777"], "verbose": true, "unknown": 1})");

  CHECK(config.publish_timeout == 2500ms);
  CHECK(config.connect_timeout == 5000ms);
  REQUIRE(config.default_relays.size() == 1);
  CHECK(config.default_relays[0] == "ws://localhost:7777");
  CHECK(config.verbose);
}

TEST_CASE("parse_probe_config rejects malformed documents", "[core][config]")
{
  using relay_probe::core::parse_probe_config;

  CHECK_THROWS_AS(parse_probe_config("{"), std::invalid_argument);
  CHECK_THROWS_AS(parse_probe_config("[]"), std::invalid_argument);
  CHECK_THROWS_AS(parse_probe_config(R"({"connect_timeout_ms": -1})"), std::invalid_argument);
  CHECK_THROWS_AS(parse_probe_config(R"({"connect_timeout_ms": "5s"})"), std::invalid_argument);
  CHECK_THROWS_AS(parse_probe_config(R"({"default_relays": "wss://nos.lol"})"), std::invalid_argument);
  CHECK_THROWS_AS(parse_probe_config(R"({"verbose": 1})"), std::invalid_argument);
}

TEST_CASE("parse_probe_config rejects durations that do not fit in milliseconds", "[core][config]")
{
  using relay_probe::core::parse_probe_config;

  CHECK_THROWS_AS(parse_probe_config(R"({"stress_max_hold_ms": 18446744073709551615})"), std::invalid_argument);
  CHECK_THROWS_AS(parse_probe_config(R"({"publish_timeout_ms": 9223372036854775808})"), std::invalid_argument);

  const auto config = parse_probe_config(R"({"publish_timeout_ms": 9223372036854775807})");
  CHECK(config.publish_timeout == std::chrono::milliseconds::max());
  CHECK(config.publish_timeout > 0ms);
}

TEST_CASE("load_probe_config reads files and falls back to defaults", "[core][config]")
{
  const auto dir = std::filesystem::temp_directory_path() / "relay_probe_config_tests";
  std::filesystem::create_directories(dir);

  SECTION("missing file gives defaults")
  {
    const auto config = relay_probe::core::load_probe_config((dir / "absent.json").string());
    CHECK(config.connect_timeout == 5000ms);
  }

  SECTION("existing file is parsed")
  {
    const auto path = dir / "config.json";
    {
      std::ofstream file(path);
      file << R"({"stress_max_hold_ms": 10})";
    }

    const auto config = relay_probe::core::load_probe_config(path.string());
    CHECK(config.stress_max_hold == 10ms);
  }

  std::filesystem::remove_all(dir);
}
