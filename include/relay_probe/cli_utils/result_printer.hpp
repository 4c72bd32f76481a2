#pragma once

#include <relay_probe/core/results.hpp>
#include <relay_probe/session/activity_log.hpp>
#include <relay_probe/session/connection_state.hpp>

#include <string>
#include <vector>

namespace relay_probe::cli_utils {

/// @name Human-readable rendering of probe results
/// @{
[[nodiscard]] auto format_result(const core::health_check_result &result) -> std::string;
[[nodiscard]] auto format_result(const core::ping_result &result) -> std::string;
[[nodiscard]] auto format_result(const core::relay_info &info) -> std::string;
[[nodiscard]] auto format_result(const core::compliance_result &result) -> std::string;
[[nodiscard]] auto format_result(const core::publish_result &result) -> std::string;
[[nodiscard]] auto format_result(const core::stress_test_result &result) -> std::string;
/// @}

/// One line per compared relay, in the order given
[[nodiscard]] auto format_comparison(const std::vector<core::compliance_result> &results) -> std::string;

/// One monitor line: "[HH:MM:SS.mmm] KIND message"
[[nodiscard]] auto format_log_entry(const session::log_entry &entry) -> std::string;

[[nodiscard]] auto format_status(session::connection_state state) -> std::string;

/**
 * @brief Orders comparison results for display.
 *
 * Relays that answered at least one ping come first, fastest average latency
 * first; unreachable relays follow in input order.
 */
auto sort_by_latency(std::vector<core::compliance_result> &results) -> void;

}// namespace relay_probe::cli_utils
