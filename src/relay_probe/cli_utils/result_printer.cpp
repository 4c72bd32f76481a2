#include <relay_probe/cli_utils/result_printer.hpp>
#include <relay_probe/platform/time_utils.hpp>

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iterator>

namespace relay_probe::cli_utils {

namespace {
  auto yes_no(bool value) -> const char * { return value ? "yes" : "no"; }

  auto join_nips(const std::vector<int> &nips) -> std::string { return fmt::format("{}", fmt::join(nips, ", ")); }
}// namespace

auto format_result(const core::health_check_result &result) -> std::string
{
  if (not result.is_healthy) {
    return fmt::format("{}: unhealthy ({})\n", result.url, result.error_message.value_or("Unknown error"));
  }
  return fmt::format("{}: healthy\n  latency: {:.1f} ms\n  read: {}\n  write: {}\n",
    result.url,
    result.latency_ms,
    yes_no(result.supports_read),
    yes_no(result.supports_write));
}

auto format_result(const core::ping_result &result) -> std::string
{
  if (not result.success) { return fmt::format("ping failed: {}\n", result.error_message.value_or("Unknown error")); }
  return fmt::format("ping: {:.1f} ms\n", result.latency_ms);
}

auto format_result(const core::relay_info &info) -> std::string
{
  if (info.status != session::connection_state::connected) {
    return fmt::format("{}: no relay information ({})\n", info.url, info.error_message.value_or("Unknown error"));
  }

  std::string out = fmt::format("{}\n", info.url);
  if (info.software) { fmt::format_to(std::back_inserter(out), "  software: {}\n", *info.software); }
  if (info.version) { fmt::format_to(std::back_inserter(out), "  version: {}\n", *info.version); }
  if (info.supported_nips) { fmt::format_to(std::back_inserter(out), "  NIPs: {}\n", join_nips(*info.supported_nips)); }
  return out;
}

auto format_result(const core::compliance_result &result) -> std::string
{
  return fmt::format("{}\n  NIP-01: {}\n  NIP-42 auth: {}\n  NIP-45 count: {}\n  success: {:.0f}% of {}\n"
                     "  average latency: {:.1f} ms\n",
    result.url,
    yes_no(result.nip01_compliant),
    yes_no(result.supports_auth),
    yes_no(result.supports_count),
    result.success_ratio * 100.0,// NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    result.tested,
    result.average_latency_ms);
}

auto format_result(const core::publish_result &result) -> std::string
{
  return fmt::format("{}: {} ({}) in {:.1f} ms\n",
    result.relay,
    result.success ? "accepted" : "rejected",
    result.message.value_or(""),
    result.latency_ms);
}

auto format_result(const core::stress_test_result &result) -> std::string
{
  return fmt::format("{}\n  connections: {} ok / {} failed of {}\n  average latency: {:.1f} ms\n"
                     "  elapsed: {} ms (requested {} ms)\n",
    result.url,
    result.successful_connections,
    result.failed_connections,
    result.total_connections,
    result.average_latency_ms,
    result.duration_ms,
    result.requested_duration_ms);
}

auto format_comparison(const std::vector<core::compliance_result> &results) -> std::string
{
  std::string out;
  for (const auto &result : results) {
    fmt::format_to(std::back_inserter(out),
      "{:<40} {:>9.1f} ms {:>4.0f}%  nip01={} auth={} count={}\n",
      result.url,
      result.average_latency_ms,
      result.success_ratio * 100.0,// NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
      yes_no(result.nip01_compliant),
      yes_no(result.supports_auth),
      yes_no(result.supports_count));
  }
  return out;
}

auto format_log_entry(const session::log_entry &entry) -> std::string
{
  auto line = fmt::format("[{}] {:<8} {}", platform::format_time_hms(entry.timestamp), to_string(entry.kind), entry.message);
  if (entry.payload) { fmt::format_to(std::back_inserter(line), " {}", *entry.payload); }
  line.push_back('\n');
  return line;
}

auto format_status(session::connection_state state) -> std::string
{
  return fmt::format("status: {}\n", session::to_string(state));
}

auto sort_by_latency(std::vector<core::compliance_result> &results) -> void
{
  std::ranges::stable_sort(results, [](const core::compliance_result &lhs, const core::compliance_result &rhs) {
    const bool lhs_reachable = lhs.success_ratio > 0;
    const bool rhs_reachable = rhs.success_ratio > 0;
    if (lhs_reachable != rhs_reachable) { return lhs_reachable; }
    if (not lhs_reachable) { return false; }
    return lhs.average_latency_ms < rhs.average_latency_ms;
  });
}

}// namespace relay_probe::cli_utils
