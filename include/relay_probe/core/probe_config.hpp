#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace relay_probe::core {

/**
 * @brief Timing constants and defaults shared by every probe operation.
 *
 * Defaults reproduce the behaviour relay operators expect from the toolkit;
 * tests shorten the timeouts.
 */
struct probe_config
{
  std::chrono::milliseconds connect_timeout{ 5000 };///< Default session open timeout
  std::chrono::milliseconds health_connect_timeout{ 5000 };///< Open timeout for health checks and pings
  std::chrono::milliseconds read_probe_wait{ 1000 };///< Hold time between REQ and CLOSE in a health check
  std::chrono::milliseconds publish_timeout{ 10000 };///< Wait for the OK frame after publishing
  std::chrono::milliseconds metadata_timeout{ 5000 };///< NIP-11 request timeout
  std::chrono::milliseconds monitor_poll_interval{ 100 };///< Log drain interval for relay monitors
  std::chrono::milliseconds stress_max_hold{ 1000 };///< Upper bound of the random hold per stress connection
  std::vector<std::string> default_relays{ "wss://relay.damus.io",
    "wss://relay.nostr.band",
    "wss://nos.lol",
    "wss://relay.snort.social",
    "wss://nostr.wine" };
  bool verbose{ false };
};

/// Number of pings a compliance test runs, not configurable
inline constexpr int compliance_trials = 3;

/**
 * @brief Parses a JSON configuration document on top of the defaults.
 *
 * Recognised keys: `connect_timeout_ms`, `health_connect_timeout_ms`,
 * `read_probe_wait_ms`, `publish_timeout_ms`, `metadata_timeout_ms`,
 * `monitor_poll_interval_ms`, `stress_max_hold_ms`, `default_relays`, `verbose`.
 * Unknown keys are ignored.
 *
 * @param json Configuration document
 * @return Resulting configuration
 * @throws std::invalid_argument if the document is malformed or a value has the wrong type
 */
[[nodiscard]] auto parse_probe_config(const std::string &json) -> probe_config;

/**
 * @brief Loads configuration from a file.
 *
 * @param path Path to a JSON configuration file (tilde is expanded)
 * @return Defaults when the file does not exist, otherwise the parsed configuration
 * @throws std::invalid_argument if the file exists but cannot be parsed
 */
[[nodiscard]] auto load_probe_config(const std::string &path) -> probe_config;

}// namespace relay_probe::core
