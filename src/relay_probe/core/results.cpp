#include <relay_probe/core/results.hpp>

namespace relay_probe::core {

namespace {
  template<typename T> auto put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value) -> void
  {
    if (value.has_value()) { json[key] = *value; }
  }
}// namespace

auto to_json(nlohmann::json &json, const health_check_result &result) -> void
{
  json = nlohmann::json{ { "url", result.url },
    { "isHealthy", result.is_healthy },
    { "latency", result.latency_ms },
    { "supportsRead", result.supports_read },
    { "supportsWrite", result.supports_write },
    { "responseTime", result.response_time_ms },
    { "timestamp", result.timestamp } };
  put_optional(json, "errorMessage", result.error_message);
}

auto to_json(nlohmann::json &json, const ping_result &result) -> void
{
  json = nlohmann::json{ { "success", result.success }, { "latency", result.latency_ms } };
  put_optional(json, "errorMessage", result.error_message);
}

auto to_json(nlohmann::json &json, const relay_info &info) -> void
{
  json = nlohmann::json{ { "url", info.url }, { "status", session::to_string(info.status) } };
  put_optional(json, "supported_nips", info.supported_nips);
  put_optional(json, "software", info.software);
  put_optional(json, "version", info.version);
  put_optional(json, "errorMessage", info.error_message);
}

auto to_json(nlohmann::json &json, const compliance_result &result) -> void
{
  json = nlohmann::json{ { "url", result.url },
    { "nip01Compliant", result.nip01_compliant },
    { "supportsAuth", result.supports_auth },
    { "supportsCount", result.supports_count },
    { "averageLatency", result.average_latency_ms },
    { "successRate", result.success_ratio },
    { "tested", result.tested } };
}

auto to_json(nlohmann::json &json, const publish_result &result) -> void
{
  json = nlohmann::json{ { "relay", result.relay },
    { "success", result.success },
    { "eventId", result.event_id },
    { "timestamp", result.timestamp },
    { "latency", result.latency_ms } };
  put_optional(json, "message", result.message);
}

auto to_json(nlohmann::json &json, const stress_test_result &result) -> void
{
  json = nlohmann::json{ { "url", result.url },
    { "totalConnections", result.total_connections },
    { "successfulConnections", result.successful_connections },
    { "failedConnections", result.failed_connections },
    { "averageLatency", result.average_latency_ms },
    { "duration", result.duration_ms },
    { "requestedDuration", result.requested_duration_ms } };
}

}// namespace relay_probe::core
