#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace relay_probe::platform {

/**
 * @brief Formats a unix timestamp (milliseconds) as local HH:MM:SS.mmm.
 *
 * @param unix_millis Milliseconds since the epoch
 * @return Formatted local time
 */
[[nodiscard]] auto format_time_hms(std::uint64_t unix_millis) -> std::string;

/**
 * @brief Current wall-clock time in milliseconds since the epoch.
 */
[[nodiscard]] auto unix_time_millis() -> std::uint64_t;

/**
 * @brief Milliseconds elapsed since a steady_clock time point, with sub-millisecond precision.
 */
[[nodiscard]] inline auto elapsed_millis(std::chrono::steady_clock::time_point start) -> double
{
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

}// namespace relay_probe::platform
