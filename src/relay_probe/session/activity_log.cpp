#include <relay_probe/platform/time_utils.hpp>
#include <relay_probe/session/activity_log.hpp>

#include <utility>

namespace relay_probe::session {

auto to_string(const log_kind kind) -> std::string_view
{
  switch (kind) {
  case log_kind::sent:
    return "sent";
  case log_kind::received:
    return "received";
  case log_kind::error:
    return "error";
  case log_kind::info:
    return "info";
  }
  return "info";
}

auto to_json(nlohmann::json &json, const log_entry &entry) -> void
{
  json = nlohmann::json{ { "timestamp", entry.timestamp },
    { "type", to_string(entry.kind) },
    { "message", entry.message } };
  if (entry.payload) { json["data"] = *entry.payload; }
}

auto activity_log::append(log_kind kind, std::string message, std::optional<std::string> payload) -> void
{
  const std::scoped_lock lock(mutex_);
  entries_.push_back(log_entry{ .timestamp = platform::unix_time_millis(),
    .kind = kind,
    .message = std::move(message),
    .payload = std::move(payload) });
}

auto activity_log::drain() -> std::vector<log_entry>
{
  std::vector<log_entry> drained;
  const std::scoped_lock lock(mutex_);
  drained.swap(entries_);
  return drained;
}

auto activity_log::snapshot() const -> std::vector<log_entry>
{
  const std::scoped_lock lock(mutex_);
  return entries_;
}

auto activity_log::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return entries_.size();
}

}// namespace relay_probe::session
