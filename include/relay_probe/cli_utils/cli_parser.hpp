#pragma once

#include <CLI/CLI.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace relay_probe::cli_utils {

/// Subcommand selected on the command line
enum class command : std::uint8_t {
  none,
  health,
  ping,
  info,
  compliance,
  compare,
  publish,
  batch_publish,
  stress,
  monitor,
};

struct cli_args
{
  std::string config_path = "~/.relay-probe/config.json";
  bool verbose = false;
  bool json_output = false;
  bool show_version = false;

  command selected = command::none;
  std::vector<std::string> urls;
  std::string event_source;///< File holding the signed event, or "-" for stdin
  std::size_t connection_count = 10;
  std::int64_t duration_ms = 10000;
  std::optional<std::int64_t> monitor_for_ms;
};

/// Accepts only ws:// and wss:// relay URIs
inline auto relay_url_validator() -> CLI::Validator
{
  return CLI::Validator(
    [](std::string &value) -> std::string {
      if (value.starts_with("ws://") or value.starts_with("wss://")) { return {}; }
      return "Relay URL must start with ws:// or wss://: " + value;
    },
    "RELAY_URL",
    "relay_url");
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-c,--config", args.config_path, "Path to configuration file");
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--json", args.json_output, "Print results as JSON");
  app.add_flag("--version", args.show_version, "Show version information");

  const auto single_url = [&app, &args](const std::string &name, const std::string &description, command selected) {
    auto *cmd = app.add_subcommand(name, description);
    cmd->add_option("url", args.urls, "Relay URL")->required()->expected(1)->check(relay_url_validator());
    cmd->callback([&args, selected]() { args.selected = selected; });
    return cmd;
  };

  single_url("health", "Check relay health and read capability", command::health);
  single_url("ping", "Measure connection latency", command::ping);
  single_url("info", "Fetch the relay information document (NIP-11)", command::info);
  single_url("compliance", "Score protocol compliance", command::compliance);

  auto *compare_cmd = app.add_subcommand("compare", "Compare several relays; uses the default list when none given");
  compare_cmd->add_option("urls", args.urls, "Relay URLs")->check(relay_url_validator());
  compare_cmd->callback([&args]() { args.selected = command::compare; });

  auto *publish_cmd = single_url("publish", "Publish a signed event", command::publish);
  publish_cmd->add_option("-e,--event", args.event_source, "File holding the signed event JSON, - for stdin")
    ->required();

  auto *batch_cmd = app.add_subcommand("batch-publish", "Publish a signed event to several relays");
  batch_cmd->add_option("urls", args.urls, "Relay URLs")->required()->check(relay_url_validator());
  batch_cmd->add_option("-e,--event", args.event_source, "File holding the signed event JSON, - for stdin")
    ->required();
  batch_cmd->callback([&args]() { args.selected = command::batch_publish; });

  auto *stress_cmd = single_url("stress", "Open many concurrent connections", command::stress);
  stress_cmd->add_option("-n,--connections", args.connection_count, "Number of connections")
    ->check(CLI::PositiveNumber);
  stress_cmd->add_option("-d,--duration", args.duration_ms, "Requested duration in milliseconds")
    ->check(CLI::NonNegativeNumber);

  auto *monitor_cmd = single_url("monitor", "Stream relay activity until interrupted", command::monitor);
  monitor_cmd->add_option("--for", args.monitor_for_ms, "Stop after this many milliseconds")
    ->check(CLI::PositiveNumber);

  app.require_subcommand(0, 1);
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "Relay Probe - Nostr relay diagnostics", "relay-probe" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    const auto exit_code = app.exit(e);
    std::exit(exit_code == 0 ? EXIT_SUCCESS : EXIT_FAILURE);// NOLINT(concurrency-mt-unsafe)
  }

  return args;
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.show_version) { return true; }

  if (args.selected == command::none) {
    spdlog::error("No command given, see --help");
    return false;
  }

  if ((args.selected == command::publish or args.selected == command::batch_publish) and args.event_source.empty()) {
    spdlog::error("Publishing requires --event");
    return false;
  }

  if (args.selected == command::stress and args.connection_count == 0) {
    spdlog::error("Stress test requires at least one connection");
    return false;
  }

  return true;
}

}// namespace relay_probe::cli_utils
