#pragma once

#include <relay_probe/core/results.hpp>
#include <relay_probe/transport/endpoint.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <functional>
#include <string>

namespace relay_probe::nostr {

/**
 * @brief Fetches relay information documents (NIP-11) over HTTP(S).
 *
 * The relay URI is translated to its companion address (wss:// to https://,
 * ws:// to http://) and requested with `Accept: application/nostr+json`.
 */
class relay_info_client
{
public:
  /// Host name lookup step; the default uses the system resolver.
  using resolver_fn = std::function<boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type>(std::string,
    std::string)>;

  /**
   * @param timeout Deadline covering name resolution, connect, TLS handshake, request and response
   * @param resolve Lookup used before connecting; empty selects the system resolver
   */
  explicit relay_info_client(std::chrono::milliseconds timeout, resolver_fn resolve = {});

  /**
   * @brief Retrieves the relay information document.
   *
   * @param url Relay URI
   * @return Parsed information with status connected, or status error with a
   *         message (`HTTP <code>` for non-2xx responses); never throws
   */
  auto fetch(std::string url) -> boost::asio::awaitable<core::relay_info>;

private:
  using response_t = boost::beast::http::response<boost::beast::http::string_body>;

  auto request_document(const transport::endpoint &target) -> boost::asio::awaitable<response_t>;

  auto resolve_before(const transport::endpoint &target, std::chrono::steady_clock::time_point deadline)
    -> boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type>;

  std::chrono::milliseconds timeout_;
  resolver_fn resolve_;
  boost::asio::ssl::context ssl_context_;
};

}// namespace relay_probe::nostr
