#include <relay_probe/transport/websocket_stream.hpp>

#include "internal_use_only/config.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>

namespace relay_probe::transport {

namespace {
  template<typename WebSocket> auto configure_client(WebSocket &websocket) -> void
  {
    namespace beast = boost::beast;

    websocket.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));
    websocket.set_option(beast::websocket::stream_base::decorator([](beast::websocket::request_type &req) {
      req.set(beast::http::field::user_agent,
        std::string(BOOST_BEAST_VERSION_STRING) + " relay-probe/" + std::string(relay_probe::cmake::project_version));
    }));
  }

  auto handshake_host(std::string_view host, std::string_view port, bool secure) -> std::string
  {
    const std::string_view default_port = secure ? "443" : "80";
    if (port == default_port) { return std::string(host); }
    return std::string(host) + ":" + std::string(port);
  }
}// namespace

websocket_stream::websocket_stream(boost::asio::io_context &io_context)
  : strand_(boost::asio::make_strand(io_context)), ssl_context_(boost::asio::ssl::context::tlsv12_client),
    resolver_(strand_)
{
  ssl_context_.set_default_verify_paths();
  ssl_context_.set_verify_mode(boost::asio::ssl::verify_peer);
}

auto websocket_stream::async_connect(websocket_connection_params params, handler_t handler) -> void
{
  auto host_str = std::string(params.host);
  auto port_str = std::string(params.port);
  auto path_str = std::string(params.path);
  auto header_host = handshake_host(params.host, params.port, params.secure);

  resolver_.async_resolve(host_str,
    port_str,
    [this, secure = params.secure, host_str, header_host, path_str, handler = std::move(handler)](
      const boost::system::error_code &error_code,
      const boost::asio::ip::tcp::resolver::results_type &results) mutable {
      if (error_code) {
        handler(error_code, 0);
        return;
      }

      if (secure) {
        connect_tls(results, host_str, header_host, path_str, std::move(handler));
      } else {
        connect_plain(results, header_host, path_str, std::move(handler));
      }
    });
}

auto websocket_stream::connect_plain(const boost::asio::ip::tcp::resolver::results_type &results,
  std::string host,
  std::string path,
  handler_t handler) -> void
{
  namespace beast = boost::beast;

  plain_ws_ = std::make_unique<plain_stream_t>(strand_);
  beast::get_lowest_layer(*plain_ws_).expires_after(std::chrono::seconds(connection_timeout_seconds));

  beast::get_lowest_layer(*plain_ws_).async_connect(results,
    [this, host = std::move(host), path = std::move(path), handler = std::move(handler)](
      const boost::system::error_code &connect_error, const boost::asio::ip::tcp::endpoint & /*endpoint*/) mutable {
      if (connect_error) {
        handler(connect_error, 0);
        return;
      }

      beast::get_lowest_layer(*plain_ws_).expires_never();
      configure_client(*plain_ws_);

      plain_ws_->async_handshake(
        host, path, [this, handler = std::move(handler)](const boost::system::error_code &ws_error) {
          open_ = not ws_error;
          handler(ws_error, 0);
        });
    });
}

auto websocket_stream::connect_tls(const boost::asio::ip::tcp::resolver::results_type &results,
  std::string host,
  std::string handshake_host,
  std::string path,
  handler_t handler) -> void
{
  namespace beast = boost::beast;

  tls_ws_ = std::make_unique<tls_stream_t>(strand_, ssl_context_);
  beast::get_lowest_layer(*tls_ws_).expires_after(std::chrono::seconds(connection_timeout_seconds));

  beast::get_lowest_layer(*tls_ws_).async_connect(results,
    [this,
      host = std::move(host),
      handshake_host = std::move(handshake_host),
      path = std::move(path),
      handler = std::move(handler)](
      const boost::system::error_code &connect_error, const boost::asio::ip::tcp::endpoint & /*endpoint*/) mutable {
      if (connect_error) {
        handler(connect_error, 0);
        return;
      }

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-cstyle-cast,hicpp-no-array-decay)
      if (not SSL_set_tlsext_host_name(tls_ws_->next_layer().native_handle(), host.c_str())) {
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
        handler(boost::asio::error::operation_not_supported, 0);
        return;
      }

      tls_ws_->next_layer().async_handshake(boost::asio::ssl::stream_base::client,
        [this, handshake_host = std::move(handshake_host), path = std::move(path), handler = std::move(handler)](
          const boost::system::error_code &ssl_error) mutable {
          if (ssl_error) {
            handler(ssl_error, 0);
            return;
          }

          beast::get_lowest_layer(*tls_ws_).expires_never();
          configure_client(*tls_ws_);

          tls_ws_->async_handshake(handshake_host,
            path,
            [this, handler = std::move(handler)](const boost::system::error_code &ws_error) {
              open_ = not ws_error;
              handler(ws_error, 0);
            });
        });
    });
}

auto websocket_stream::async_write(const std::span<const std::byte> data, handler_t handler) -> void
{
  const bool has_stream = visit_stream([&data, &handler](auto &websocket) {
    websocket.text(true);
    websocket.async_write(boost::asio::buffer(data.data(), data.size()),
      [handler = std::move(handler)](const boost::system::error_code &error_code, std::size_t bytes_transferred) {
        handler(error_code, bytes_transferred);
      });
  });

  if (not has_stream) {
    boost::asio::post(
      strand_, [handler = std::move(handler)]() { handler(boost::asio::error::not_connected, 0); });
  }
}

auto websocket_stream::async_read(const boost::asio::mutable_buffer &buffer, handler_t handler) -> void
{
  read_buffer_.clear();
  const bool has_stream = visit_stream([this, &buffer, &handler](auto &websocket) {
    websocket.async_read(read_buffer_,
      [this, buffer, handler = std::move(handler)](
        const boost::system::error_code &error_code, std::size_t /*bytes_transferred*/) {
        if (not error_code) {
          const auto data = read_buffer_.data();
          const std::size_t size = std::min(boost::asio::buffer_size(buffer), data.size());
          boost::asio::buffer_copy(buffer, data, size);
          handler(error_code, size);
        } else {
          handler(error_code, 0);
        }
      });
  });

  if (not has_stream) {
    boost::asio::post(
      strand_, [handler = std::move(handler)]() { handler(boost::asio::error::not_connected, 0); });
  }
}

auto websocket_stream::async_close(handler_t handler) -> void
{
  namespace beast = boost::beast;

  if (not open_) {
    resolver_.cancel();
    visit_stream([](auto &websocket) {
      auto &socket = beast::get_lowest_layer(websocket);
      socket.cancel();
      socket.close();
    });
    boost::asio::post(strand_, [handler = std::move(handler)]() { handler(boost::system::error_code{}, 0); });
    return;
  }

  open_ = false;
  visit_stream([&handler](auto &websocket) {
    websocket.async_close(beast::websocket::close_code::normal,
      [handler = std::move(handler)](const boost::system::error_code &error_code) { handler(error_code, 0); });
  });
}

}// namespace relay_probe::transport
