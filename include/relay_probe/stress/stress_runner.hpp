#pragma once

#include <relay_probe/async/join_all.hpp>
#include <relay_probe/concepts/websocket_stream.hpp>
#include <relay_probe/core/probe_config.hpp>
#include <relay_probe/core/results.hpp>
#include <relay_probe/platform/time_utils.hpp>
#include <relay_probe/session/connection_session.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <random>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace relay_probe::stress {

/**
 * @brief Opens many concurrent sessions against one relay and aggregates the outcome.
 *
 * @tparam Stream Transport satisfying concepts::websocket_stream
 */
template<concepts::websocket_stream Stream> class stress_runner
{
public:
  stress_runner(session::stream_factory<Stream> factory, core::probe_config config)
    : factory_(std::move(factory)), config_(std::move(config)), random_engine_(std::random_device{}())
  {}

  /**
   * @brief Runs `connection_count` connection attempts concurrently.
   *
   * Each successful attempt holds its connection for a random interval up to
   * probe_config::stress_max_hold before closing. Failed attempts are not retried.
   * `requested_duration` is reported back but does not cut attempts short.
   *
   * @param url Relay URI
   * @param connection_count Number of attempts
   * @param requested_duration Duration asked for by the caller
   * @return Aggregate result with successful + failed == connection_count
   */
  auto run(std::string url, std::size_t connection_count, std::chrono::milliseconds requested_duration)
    -> boost::asio::awaitable<core::stress_test_result>
  {
    const auto start = std::chrono::steady_clock::now();
    spdlog::info("[stress] Opening {} connections to {}", connection_count, url);

    std::vector<boost::asio::awaitable<attempt_outcome>> tasks;
    tasks.reserve(connection_count);
    for (std::size_t index = 0; index < connection_count; ++index) { tasks.push_back(attempt(url, next_hold())); }

    const auto outcomes = co_await async::join_all(std::move(tasks));

    core::stress_test_result result{ .url = url, .total_connections = connection_count };
    double latency_sum = 0;
    for (const auto &outcome : outcomes) {
      if (outcome.connected) {
        ++result.successful_connections;
        latency_sum += outcome.latency_ms;
      } else {
        ++result.failed_connections;
      }
    }

    if (result.successful_connections > 0) {
      result.average_latency_ms = latency_sum / static_cast<double>(result.successful_connections);
    }
    result.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    result.requested_duration_ms = requested_duration.count();

    spdlog::info("[stress] {}: {}/{} connected, avg {:.1f}ms",
      url,
      result.successful_connections,
      result.total_connections,
      result.average_latency_ms);
    co_return result;
  }

private:
  struct attempt_outcome
  {
    bool connected{ false };
    double latency_ms{ 0 };
  };

  auto next_hold() -> std::chrono::milliseconds
  {
    std::uniform_int_distribution<std::chrono::milliseconds::rep> hold(0, config_.stress_max_hold.count());
    return std::chrono::milliseconds(hold(random_engine_));
  }

  auto attempt(std::string url, std::chrono::milliseconds hold) -> boost::asio::awaitable<attempt_outcome>
  {
    const auto start = std::chrono::steady_clock::now();
    attempt_outcome outcome;

    auto connection = std::make_shared<session::connection_session<Stream>>(factory_, url);
    try {
      co_await connection->open(config_.connect_timeout);
      outcome.connected = true;
      outcome.latency_ms = platform::elapsed_millis(start);

      auto executor = co_await boost::asio::this_coro::executor;
      boost::asio::steady_timer hold_timer(executor, hold);
      boost::system::error_code wait_error;
      co_await hold_timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));
    } catch (const session::connect_error &e) {
      spdlog::debug("[stress] Attempt against {} failed: {}", url, e.what());
    }

    connection->close();
    co_return outcome;
  }

  session::stream_factory<Stream> factory_;
  core::probe_config config_;
  std::mt19937 random_engine_;
};

}// namespace relay_probe::stress
