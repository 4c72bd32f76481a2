#pragma once

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string_view>

namespace relay_probe::transport {

/**
 * @brief Parameters for establishing a WebSocket connection.
 */
struct websocket_connection_params
{
  std::string_view host;///< Hostname or IP address
  std::string_view port;///< Port number ("443" for wss://, "80" for ws://)
  std::string_view path;///< WebSocket path (e.g., "/" or "/api/v1")
  bool secure{ true };///< Negotiate TLS before the WebSocket handshake
};

/**
 * @brief WebSocket stream over plain TCP or TLS.
 *
 * Provides asynchronous operations for relay connections using Boost.Beast. The
 * underlying Beast stream is created on connect, according to `secure`.
 */
class websocket_stream
{
private:
  using plain_stream_t = boost::beast::websocket::stream<boost::beast::tcp_stream>;
  using tls_stream_t = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;
  using handler_t = std::function<void(const boost::system::error_code &, std::size_t)>;

  static constexpr int connection_timeout_seconds = 30;

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ssl::context ssl_context_;
  boost::asio::ip::tcp::resolver resolver_;
  std::unique_ptr<plain_stream_t> plain_ws_;
  std::unique_ptr<tls_stream_t> tls_ws_;
  boost::beast::flat_buffer read_buffer_;
  bool open_{ false };

  auto connect_plain(const boost::asio::ip::tcp::resolver::results_type &results,
    std::string host,
    std::string path,
    handler_t handler) -> void;

  auto connect_tls(const boost::asio::ip::tcp::resolver::results_type &results,
    std::string host,
    std::string handshake_host,
    std::string path,
    handler_t handler) -> void;

  template<typename Fn> auto visit_stream(Fn &&visitor) -> bool
  {
    if (tls_ws_) {
      visitor(*tls_ws_);
      return true;
    }
    if (plain_ws_) {
      visitor(*plain_ws_);
      return true;
    }
    return false;
  }

public:
  /**
   * @brief Constructs a WebSocket stream.
   *
   * @param io_context Boost.Asio io_context for async operations
   */
  explicit websocket_stream(boost::asio::io_context &io_context);

  /**
   * @brief Asynchronously connects to a WebSocket endpoint.
   *
   * @param params Connection parameters (host, port, path, security)
   * @param handler Completion handler called with error code and bytes transferred
   */
  auto async_connect(websocket_connection_params params, handler_t handler) -> void;

  /**
   * @brief Asynchronously writes one text message to the WebSocket.
   *
   * @param data Data bytes to write
   * @param handler Completion handler called with error code and bytes transferred
   */
  auto async_write(std::span<const std::byte> data, handler_t handler) -> void;

  /**
   * @brief Asynchronously reads one message from the WebSocket.
   *
   * Messages larger than the buffer are truncated to the buffer size.
   *
   * @param buffer Buffer to store received data
   * @param handler Completion handler called with error code and bytes transferred
   */
  auto async_read(const boost::asio::mutable_buffer &buffer, handler_t handler) -> void;

  /**
   * @brief Asynchronously closes the WebSocket connection.
   *
   * Before the handshake has completed this aborts the pending connect instead.
   *
   * @param handler Completion handler called with error code and bytes transferred
   */
  auto async_close(handler_t handler) -> void;
};

}// namespace relay_probe::transport
