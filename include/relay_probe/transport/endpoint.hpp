#pragma once

#include <string>
#include <string_view>

namespace relay_probe::transport {

/**
 * @brief A relay URI split into its connection parts.
 */
struct endpoint
{
  std::string host;///< Hostname or IP address
  std::string port;///< Port number ("443" for wss://, "80" for ws://)
  std::string path;///< Request target, always starts with '/'
  bool secure{ true };///< true for wss:// (TLS), false for ws://

  /**
   * @brief Parses a relay URI.
   *
   * Accepts `ws://` and `wss://`; a URI without a scheme is treated as `wss://`.
   *
   * @param address Relay URI
   * @return Parsed endpoint
   * @throws std::invalid_argument on any other scheme or an empty host
   */
  [[nodiscard]] static auto parse(std::string_view address) -> endpoint;

  /**
   * @brief Translates a relay URI into its companion HTTP(S) address.
   *
   * `wss://` becomes `https://` and `ws://` becomes `http://`; everything after
   * the scheme is kept.
   *
   * @param address Relay URI
   * @return Request/response URL used for NIP-11 lookups
   */
  [[nodiscard]] static auto to_http_url(std::string_view address) -> std::string;

  /// Value for the HTTP Host header: host, plus port when it is not the scheme default.
  [[nodiscard]] auto host_header() const -> std::string;
};

}// namespace relay_probe::transport
