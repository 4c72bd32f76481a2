#include <relay_probe/core/probe_config.hpp>
#include <relay_probe/platform/env_utils.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace relay_probe::core {

namespace {
  auto read_millis(const nlohmann::json &json_obj, const char *key, std::chrono::milliseconds &target) -> void
  {
    if (not json_obj.contains(key)) { return; }
    const auto &value = json_obj[key];
    if (not value.is_number_unsigned()) {
      throw std::invalid_argument(std::string("Configuration key '") + key + "' must be a non-negative integer");
    }
    const auto millis = value.get<std::uint64_t>();
    if (millis > static_cast<std::uint64_t>(std::chrono::milliseconds::max().count())) {
      throw std::invalid_argument(std::string("Configuration key '") + key + "' is out of range");
    }
    target = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(millis));
  }
}// namespace

auto parse_probe_config(const std::string &json) -> probe_config
{
  nlohmann::json json_obj;
  try {
    json_obj = nlohmann::json::parse(json);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::invalid_argument(std::string("Malformed configuration: ") + e.what());
  }

  if (not json_obj.is_object()) { throw std::invalid_argument("Configuration must be a JSON object"); }

  probe_config config;
  read_millis(json_obj, "connect_timeout_ms", config.connect_timeout);
  read_millis(json_obj, "health_connect_timeout_ms", config.health_connect_timeout);
  read_millis(json_obj, "read_probe_wait_ms", config.read_probe_wait);
  read_millis(json_obj, "publish_timeout_ms", config.publish_timeout);
  read_millis(json_obj, "metadata_timeout_ms", config.metadata_timeout);
  read_millis(json_obj, "monitor_poll_interval_ms", config.monitor_poll_interval);
  read_millis(json_obj, "stress_max_hold_ms", config.stress_max_hold);

  if (json_obj.contains("default_relays")) {
    const auto &relays = json_obj["default_relays"];
    if (not relays.is_array()) { throw std::invalid_argument("Configuration key 'default_relays' must be an array"); }
    config.default_relays.clear();
    for (const auto &relay : relays) {
      if (not relay.is_string()) { throw std::invalid_argument("Configuration key 'default_relays' must hold strings"); }
      config.default_relays.push_back(relay.get<std::string>());
    }
  }

  if (json_obj.contains("verbose")) {
    if (not json_obj["verbose"].is_boolean()) {
      throw std::invalid_argument("Configuration key 'verbose' must be a boolean");
    }
    config.verbose = json_obj["verbose"].get<bool>();
  }

  return config;
}

auto load_probe_config(const std::string &path) -> probe_config
{
  const auto expanded = platform::expand_tilde_path(path);

  if (not std::filesystem::exists(expanded)) {
    spdlog::debug("[config] No configuration at {}, using defaults", expanded);
    return probe_config{};
  }

  std::ifstream file(expanded);
  if (not file) { throw std::invalid_argument("Cannot open configuration file: " + expanded); }

  const std::string content{ std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
  spdlog::debug("[config] Loaded configuration from {}", expanded);
  return parse_probe_config(content);
}

}// namespace relay_probe::core
