#pragma once

#include <cstdint>
#include <string_view>

namespace relay_probe::session {

/// Lifecycle state of a connection session
enum class connection_state : std::uint8_t {
  disconnected,
  connecting,
  connected,
  error,
};

[[nodiscard]] constexpr auto to_string(const connection_state state) -> std::string_view
{
  switch (state) {
  case connection_state::disconnected:
    return "disconnected";
  case connection_state::connecting:
    return "connecting";
  case connection_state::connected:
    return "connected";
  case connection_state::error:
    return "error";
  }
  return "disconnected";
}

}// namespace relay_probe::session
