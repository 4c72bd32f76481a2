#pragma once

#include <relay_probe/concepts/websocket_stream.hpp>
#include <relay_probe/core/probe_config.hpp>
#include <relay_probe/core/results.hpp>
#include <relay_probe/core/subscription_ids.hpp>
#include <relay_probe/nostr/protocol.hpp>
#include <relay_probe/platform/time_utils.hpp>
#include <relay_probe/session/connection_session.hpp>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <tuple>

namespace relay_probe::probe {

/**
 * @brief Classifies a relay as healthy or not and measures connect latency.
 *
 * Every call opens its own session and closes it before returning; results are
 * always returned as values, never as exceptions.
 */
template<concepts::websocket_stream Stream> class health_probe
{
public:
  health_probe(session::stream_factory<Stream> factory, core::probe_config config)
    : factory_(std::move(factory)), config_(std::move(config))
  {}

  /**
   * @brief Runs a full health check against one relay.
   *
   * Connects, subscribes with a throwaway REQ, holds it for the read-probe
   * interval and CLOSEs it. Read capability is reported once the REQ was handed
   * to the connected session; write capability is assumed from the connection
   * alone, since proving it would need a signed event.
   *
   * @param url Relay URI
   * @return Health check result; error_message is set iff is_healthy is false
   */
  auto check(std::string url) -> boost::asio::awaitable<core::health_check_result>
  {
    const auto start = std::chrono::steady_clock::now();
    core::health_check_result result{ .url = url, .timestamp = platform::unix_time_millis() };

    auto connection = std::make_shared<session::connection_session<Stream>>(factory_, url);

    try {
      co_await connection->open(config_.health_connect_timeout);

      result.is_healthy = true;
      result.response_time_ms = platform::elapsed_millis(start);
      result.latency_ms = result.response_time_ms;

      const auto subscription_id = core::make_subscription_id("health_check");
      const nlohmann::json filter = { { "limit", 1 } };
      result.supports_read =
        connection->send(nostr::protocol::req{ .subscription_id = subscription_id, .filters = filter }.serialize());

      auto executor = co_await boost::asio::this_coro::executor;
      boost::asio::steady_timer hold_timer(executor, config_.read_probe_wait);
      boost::system::error_code wait_error;
      co_await hold_timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));

      std::ignore = connection->send(nostr::protocol::close{ .subscription_id = subscription_id }.serialize());

      result.supports_write = true;
    } catch (const std::exception &e) {
      result.is_healthy = false;
      result.error_message = e.what();
    }

    connection->close();

    if (not result.is_healthy and (not result.error_message or result.error_message->empty())) {
      result.error_message = "Unknown error";
    }

    spdlog::info("[health_probe] {} healthy={} latency={:.1f}ms", url, result.is_healthy, result.latency_ms);
    co_return result;
  }

  /**
   * @brief Measures the time needed to open a connection.
   *
   * @param url Relay URI
   * @return Latency on success, error text otherwise
   */
  auto ping(std::string url) -> boost::asio::awaitable<core::ping_result>
  {
    const auto start = std::chrono::steady_clock::now();
    core::ping_result result;

    auto connection = std::make_shared<session::connection_session<Stream>>(factory_, url);

    try {
      co_await connection->open(config_.health_connect_timeout);
      result.success = true;
      result.latency_ms = platform::elapsed_millis(start);
    } catch (const std::exception &e) {
      result.error_message = fmt::format("Ping failed: {}", e.what());
      result.latency_ms = platform::elapsed_millis(start);
    }

    connection->close();

    spdlog::debug("[health_probe] ping {} success={} latency={:.1f}ms", url, result.success, result.latency_ms);
    co_return result;
  }

private:
  session::stream_factory<Stream> factory_;
  core::probe_config config_;
};

}// namespace relay_probe::probe
