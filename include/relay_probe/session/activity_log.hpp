#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay_probe::session {

/// Category of a session log entry
enum class log_kind : std::uint8_t {
  sent,
  received,
  error,
  info,
};

[[nodiscard]] auto to_string(log_kind kind) -> std::string_view;

/**
 * @brief One entry in a session's activity log.
 */
struct log_entry
{
  std::uint64_t timestamp{};///< Unix time in milliseconds
  log_kind kind{ log_kind::info };
  std::string message;
  std::optional<std::string> payload;///< Raw frame text for sent/received entries, cut at the 64 KiB read limit
};

auto to_json(nlohmann::json &json, const log_entry &entry) -> void;

/**
 * @brief Append-only, thread-safe log with single-consumer draining.
 *
 * `drain()` removes every pending entry in one step, so entries appended
 * concurrently are delivered exactly once, either by this drain or the next.
 */
class activity_log
{
public:
  auto append(log_kind kind, std::string message, std::optional<std::string> payload = std::nullopt) -> void;

  /// Removes and returns all pending entries in arrival order.
  [[nodiscard]] auto drain() -> std::vector<log_entry>;

  /// Copy of the pending entries, leaving them in place.
  [[nodiscard]] auto snapshot() const -> std::vector<log_entry>;

  [[nodiscard]] auto size() const -> std::size_t;

private:
  mutable std::mutex mutex_;
  std::vector<log_entry> entries_;
};

}// namespace relay_probe::session
