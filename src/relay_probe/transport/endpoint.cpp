#include <relay_probe/transport/endpoint.hpp>

#include <stdexcept>

namespace relay_probe::transport {

namespace {
  constexpr std::string_view ws_scheme = "ws://";
  constexpr std::string_view wss_scheme = "wss://";
  constexpr std::string_view plain_port = "80";
  constexpr std::string_view tls_port = "443";
}// namespace

auto endpoint::parse(const std::string_view address) -> endpoint
{
  endpoint result;
  std::string_view remainder = address;

  if (remainder.starts_with(wss_scheme)) {
    remainder.remove_prefix(wss_scheme.size());
    result.secure = true;
  } else if (remainder.starts_with(ws_scheme)) {
    remainder.remove_prefix(ws_scheme.size());
    result.secure = false;
  } else if (remainder.find("://") != std::string_view::npos) {
    throw std::invalid_argument("Unsupported relay scheme: " + std::string(address));
  }

  result.port = result.secure ? tls_port : plain_port;
  result.path = "/";

  auto authority = remainder;
  auto slash_pos = remainder.find('/');
  if (slash_pos != std::string_view::npos) {
    authority = remainder.substr(0, slash_pos);
    result.path = std::string(remainder.substr(slash_pos));
  }

  auto colon_pos = authority.rfind(':');
  if (colon_pos != std::string_view::npos and authority.find(']', colon_pos) == std::string_view::npos) {
    result.port = std::string(authority.substr(colon_pos + 1));
    authority = authority.substr(0, colon_pos);
    if (result.port.empty()) { throw std::invalid_argument("Empty port in relay address: " + std::string(address)); }
  }

  if (authority.starts_with('[') and authority.ends_with(']')) {
    authority = authority.substr(1, authority.size() - 2);
  }

  result.host = std::string(authority);
  if (result.host.empty()) { throw std::invalid_argument("Missing host in relay address: " + std::string(address)); }

  return result;
}

auto endpoint::to_http_url(const std::string_view address) -> std::string
{
  if (address.starts_with(wss_scheme)) { return "https://" + std::string(address.substr(wss_scheme.size())); }
  if (address.starts_with(ws_scheme)) { return "http://" + std::string(address.substr(ws_scheme.size())); }
  return std::string(address);
}

auto endpoint::host_header() const -> std::string
{
  const auto default_port = secure ? tls_port : plain_port;
  if (port == default_port) { return host; }
  return host + ":" + port;
}

}// namespace relay_probe::transport
