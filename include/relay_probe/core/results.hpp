#pragma once

#include <relay_probe/session/connection_state.hpp>

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace relay_probe::core {

/// Outcome of a single health check
struct health_check_result
{
  std::string url;
  bool is_healthy{ false };
  double latency_ms{ 0 };///< Connect round-trip time
  bool supports_read{ false };
  bool supports_write{ false };///< Assumed from connection success, never round-tripped
  double response_time_ms{ 0 };
  std::uint64_t timestamp{};///< Unix milliseconds at probe start
  std::optional<std::string> error_message;///< Set if and only if the relay is unhealthy
};

/// Outcome of a connect-only latency measurement
struct ping_result
{
  bool success{ false };
  double latency_ms{ 0 };
  std::optional<std::string> error_message;
};

/// Relay information document fetched over HTTP (NIP-11)
struct relay_info
{
  std::string url;
  session::connection_state status{ session::connection_state::disconnected };
  std::optional<std::vector<int>> supported_nips;
  std::optional<std::string> software;
  std::optional<std::string> version;
  std::optional<std::string> error_message;
};

/// Protocol conformance score for one relay
struct compliance_result
{
  std::string url;
  bool nip01_compliant{ false };
  bool supports_auth{ false };
  bool supports_count{ false };
  double average_latency_ms{ 0 };///< Mean over successful pings only
  double success_ratio{ 0 };///< successes / tested, within [0, 1]
  int tested{ 0 };
};

/// Outcome of publishing one event to one relay
struct publish_result
{
  std::string relay;
  bool success{ false };
  std::string event_id;
  std::optional<std::string> message;
  std::uint64_t timestamp{};///< Unix milliseconds at publish start
  double latency_ms{ 0 };///< Elapsed time up to the deciding event
};

/// Aggregate of a concurrent connection stress run
struct stress_test_result
{
  std::string url;
  std::size_t total_connections{ 0 };
  std::size_t successful_connections{ 0 };
  std::size_t failed_connections{ 0 };
  double average_latency_ms{ 0 };///< Mean connect latency over successful attempts
  std::int64_t duration_ms{ 0 };///< Wall-clock time of the whole run
  std::int64_t requested_duration_ms{ 0 };///< Duration asked for by the caller, not enforced
};

auto to_json(nlohmann::json &json, const health_check_result &result) -> void;
auto to_json(nlohmann::json &json, const ping_result &result) -> void;
auto to_json(nlohmann::json &json, const relay_info &info) -> void;
auto to_json(nlohmann::json &json, const compliance_result &result) -> void;
auto to_json(nlohmann::json &json, const publish_result &result) -> void;
auto to_json(nlohmann::json &json, const stress_test_result &result) -> void;

}// namespace relay_probe::core
