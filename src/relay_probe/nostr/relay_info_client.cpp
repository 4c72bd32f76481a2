#include <relay_probe/nostr/protocol.hpp>
#include <relay_probe/nostr/relay_info_client.hpp>

#include "internal_use_only/config.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <fmt/format.h>
#include <exception>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace relay_probe::nostr {

namespace {
  namespace beast = boost::beast;
  namespace http = boost::beast::http;

  constexpr int http_version = 11;
  constexpr unsigned status_ok_first = 200;
  constexpr unsigned status_ok_last = 299;

  template<typename AsyncStream>
  auto exchange(AsyncStream &stream, const http::request<http::empty_body> &request)
    -> boost::asio::awaitable<http::response<http::string_body>>
  {
    co_await http::async_write(stream, request, boost::asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    co_await http::async_read(stream, buffer, response, boost::asio::use_awaitable);
    co_return response;
  }

  auto system_resolve(std::string host, std::string port)
    -> boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type>
  {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(executor);
    co_return co_await resolver.async_resolve(host, port, boost::asio::use_awaitable);
  }

  // Outcome of a lookup that may outlive the fetch that started it.
  struct pending_lookup
  {
    explicit pending_lookup(const boost::asio::any_io_executor &executor) : signal(executor) {}

    boost::asio::steady_timer signal;
    std::optional<boost::asio::ip::tcp::resolver::results_type> results;
    std::exception_ptr failure;
    bool done{ false };
  };
}// namespace

relay_info_client::relay_info_client(std::chrono::milliseconds timeout, resolver_fn resolve)
  : timeout_(timeout), resolve_(resolve ? std::move(resolve) : resolver_fn(system_resolve)),
    ssl_context_(boost::asio::ssl::context::tlsv12_client)
{
  ssl_context_.set_default_verify_paths();
  ssl_context_.set_verify_mode(boost::asio::ssl::verify_peer);
}

auto relay_info_client::fetch(std::string url) -> boost::asio::awaitable<core::relay_info>
{
  core::relay_info info{ .url = url };

  try {
    const auto target = transport::endpoint::parse(url);
    spdlog::debug("[relay_info] GET {}", transport::endpoint::to_http_url(url));

    auto response = co_await request_document(target);
    const auto status = response.result_int();

    if (status < status_ok_first or status > status_ok_last) {
      info.status = session::connection_state::error;
      info.error_message = fmt::format("HTTP {}", status);
      spdlog::warn("[relay_info] {} answered HTTP {}", url, status);
      co_return info;
    }

    auto document = protocol::relay_document::deserialize(response.body());
    if (not document) {
      info.status = session::connection_state::error;
      info.error_message = "Invalid relay information document";
      spdlog::warn("[relay_info] {} returned an unparseable document", url);
      co_return info;
    }

    info.supported_nips = std::move(document->supported_nips);
    info.software = std::move(document->software);
    info.version = std::move(document->version);
    info.status = session::connection_state::connected;
  } catch (const std::exception &e) {
    info.status = session::connection_state::error;
    info.error_message = e.what();
    spdlog::warn("[relay_info] Fetch from {} failed: {}", url, e.what());
  }

  co_return info;
}

auto relay_info_client::request_document(const transport::endpoint &target) -> boost::asio::awaitable<response_t>
{
  auto executor = co_await boost::asio::this_coro::executor;

  http::request<http::empty_body> request{ http::verb::get, target.path, http_version };
  request.set(http::field::host, target.host_header());
  request.set(http::field::accept, "application/nostr+json");
  request.set(http::field::user_agent,
    std::string(BOOST_BEAST_VERSION_STRING) + " relay-probe/" + std::string(relay_probe::cmake::project_version));

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  auto results = co_await resolve_before(target, deadline);

  if (not target.secure) {
    beast::tcp_stream stream(executor);
    stream.expires_at(deadline);
    co_await stream.async_connect(results, boost::asio::use_awaitable);

    auto response = co_await nostr::exchange(stream, request);

    boost::system::error_code shutdown_error;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, shutdown_error);
    co_return response;
  }

  beast::ssl_stream<beast::tcp_stream> stream(executor, ssl_context_);
  beast::get_lowest_layer(stream).expires_at(deadline);

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-cstyle-cast,hicpp-no-array-decay)
  if (not SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str())) {
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
    throw boost::system::system_error(boost::asio::error::operation_not_supported, "TLS SNI");
  }

  co_await beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);
  co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);

  auto response = co_await nostr::exchange(stream, request);

  boost::system::error_code shutdown_error;
  co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, shutdown_error));
  co_return response;
}

auto relay_info_client::resolve_before(const transport::endpoint &target,
  std::chrono::steady_clock::time_point deadline)
  -> boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type>
{
  auto executor = co_await boost::asio::this_coro::executor;
  auto lookup = std::make_shared<pending_lookup>(executor);
  lookup->signal.expires_at(deadline);

  boost::asio::co_spawn(
    executor,
    [lookup, resolve = resolve_, host = target.host, port = target.port]() -> boost::asio::awaitable<void> {
      try {
        lookup->results = co_await resolve(host, port);
      } catch (const std::exception &) {
        lookup->failure = std::current_exception();
      }
      lookup->done = true;
      lookup->signal.cancel();
    },
    boost::asio::detached);

  boost::system::error_code wait_error;
  co_await lookup->signal.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));

  if (not lookup->done) {
    spdlog::debug("[relay_info] Resolving {} exceeded {}ms", target.host, timeout_.count());
    throw std::runtime_error(fmt::format("Resolving {} timed out", target.host));
  }
  if (lookup->failure) { std::rethrow_exception(lookup->failure); }
  co_return *lookup->results;
}

}// namespace relay_probe::nostr
