#pragma once

#include <relay_probe/cli_utils/cli_parser.hpp>
#include <relay_probe/core/probe_config.hpp>
#include <relay_probe/nostr/protocol.hpp>

#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

#include "internal_use_only/config.hpp"

namespace relay_probe::cli_utils {

inline auto configure_logging(const cli_args &args, const core::probe_config &config) -> void
{
  spdlog::set_level(args.verbose or config.verbose ? spdlog::level::debug : spdlog::level::warn);
}

inline auto print_version() -> void
{
  fmt::print("{} v{}\n", relay_probe::cmake::project_name, relay_probe::cmake::project_version);
}

/**
 * @brief Loads the configuration named on the command line and applies flag overrides.
 *
 * @throws std::invalid_argument if the file exists but is malformed
 */
inline auto load_config(const cli_args &args) -> core::probe_config
{
  auto config = core::load_probe_config(args.config_path);
  if (args.verbose) { config.verbose = true; }
  return config;
}

/**
 * @brief Reads and parses the signed event to publish.
 *
 * @param source Path of a JSON file, or "-" to read standard input
 * @throws std::invalid_argument if the source cannot be read or does not hold a valid event
 */
inline auto read_signed_event(const std::string &source) -> nostr::protocol::event_data
{
  std::string text;
  if (source == "-") {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream file(source);
    if (not file) { throw std::invalid_argument("Cannot open event file: " + source); }
    text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  auto event = nostr::protocol::event_data::deserialize(text);
  if (not event) { throw std::invalid_argument("Not a valid signed event: " + source); }
  return std::move(*event);
}

}// namespace relay_probe::cli_utils
