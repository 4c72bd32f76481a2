#include <relay_probe/cli_utils/cli_parser.hpp>

#include <CLI/CLI.hpp>
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

namespace {
auto create_argv(std::vector<std::string> &args) -> std::vector<char *>
{
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) { argv.push_back(arg.data()); }
  return argv;
}

auto parse(std::vector<std::string> args) -> relay_probe::cli_utils::cli_args
{
  auto argv = create_argv(args);
  return relay_probe::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());
}

auto parse_strict(std::vector<std::string> args) -> relay_probe::cli_utils::cli_args
{
  relay_probe::cli_utils::cli_args parsed;
  CLI::App app{ "test", "relay-probe" };
  relay_probe::cli_utils::setup_cli_app(app, parsed);
  auto argv = create_argv(args);
  app.parse(static_cast<int>(args.size()), argv.data());
  return parsed;
}
}// namespace

using relay_probe::cli_utils::command;

TEST_CASE("CLI parsing global flags", "[cli_utils][cli_parser][integration]")
{
  SECTION("version flag sets show_version") { CHECK(parse({ "relay-probe", "--version" }).show_version); }

  SECTION("short verbose flag works") { CHECK(parse({ "relay-probe", "-v", "ping", "wss://nos.lol" }).verbose); }

  SECTION("json flag and config path")
  {
    auto parsed = parse({ "relay-probe", "--json", "-c", "/tmp/probe.json", "health", "wss://nos.lol" });
    CHECK(parsed.json_output);
    CHECK(parsed.config_path == "/tmp/probe.json");
  }
}

TEST_CASE("CLI parsing single relay subcommands", "[cli_utils][cli_parser][integration]")
{
  SECTION("health")
  {
    auto parsed = parse({ "relay-probe", "health", "wss://relay.damus.io" });
    CHECK(parsed.selected == command::health);
    CHECK(parsed.urls == std::vector<std::string>{ "wss://relay.damus.io" });
  }

  SECTION("info and compliance")
  {
    CHECK(parse({ "relay-probe", "info", "wss://nos.lol" }).selected == command::info);
    CHECK(parse({ "relay-probe", "compliance", "ws://localhost:7777" }).selected == command::compliance);
  }

  SECTION("stress with count and duration")
  {
    auto parsed = parse({ "relay-probe", "stress", "wss://nos.lol", "-n", "25", "-d", "5000" });
    CHECK(parsed.selected == command::stress);
    CHECK(parsed.connection_count == 25);
    CHECK(parsed.duration_ms == 5000);
  }

  SECTION("monitor with a bound")
  {
    auto parsed = parse({ "relay-probe", "monitor", "wss://nos.lol", "--for", "1500" });
    CHECK(parsed.selected == command::monitor);
    REQUIRE(parsed.monitor_for_ms.has_value());
    CHECK(*parsed.monitor_for_ms == 1500);
  }

  SECTION("publish with event file")
  {
    auto parsed = parse({ "relay-probe", "publish", "wss://nos.lol", "--event", "note.json" });
    CHECK(parsed.selected == command::publish);
    CHECK(parsed.event_source == "note.json");
  }
}

TEST_CASE("CLI parsing multi relay subcommands", "[cli_utils][cli_parser][integration]")
{
  SECTION("compare without relays uses the default list later")
  {
    auto parsed = parse({ "relay-probe", "compare" });
    CHECK(parsed.selected == command::compare);
    CHECK(parsed.urls.empty());
  }

  SECTION("compare with relays")
  {
    auto parsed = parse({ "relay-probe", "compare", "wss://a.test", "wss://b.test" });
    CHECK(parsed.urls.size() == 2);
  }

  SECTION("batch-publish")
  {
    auto parsed = parse({ "relay-probe", "batch-publish", "wss://a.test", "wss://b.test", "-e", "-" });
    CHECK(parsed.selected == command::batch_publish);
    CHECK(parsed.urls.size() == 2);
    CHECK(parsed.event_source == "-");
  }
}

TEST_CASE("CLI parsing rejects bad input", "[cli_utils][cli_parser][integration]")
{
  CHECK_THROWS_AS(parse_strict({ "relay-probe", "health", "https://nos.lol" }), CLI::ValidationError);
  CHECK_THROWS_AS(parse_strict({ "relay-probe", "compare", "wss://a.test", "nos.lol" }), CLI::ValidationError);
  CHECK_THROWS_AS(parse_strict({ "relay-probe", "health" }), CLI::RequiredError);
  CHECK_THROWS_AS(parse_strict({ "relay-probe", "publish", "wss://nos.lol" }), CLI::RequiredError);
  CHECK_THROWS_AS(parse_strict({ "relay-probe", "stress", "wss://nos.lol", "-n", "0" }), CLI::ValidationError);
}
