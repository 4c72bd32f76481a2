#pragma once

#include <relay_probe/concepts/websocket_stream.hpp>
#include <relay_probe/core/probe_config.hpp>
#include <relay_probe/monitor/monitor_handle.hpp>
#include <relay_probe/session/activity_log.hpp>
#include <relay_probe/session/connection_session.hpp>
#include <relay_probe/session/connection_state.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace relay_probe::monitor {

using log_handler_t = std::function<void(const session::log_entry &)>;
using status_handler_t = std::function<void(session::connection_state)>;

/**
 * @brief Keeps one session open and streams its activity until cancelled.
 *
 * Status changes are forwarded as they happen; log entries are drained from
 * the session every probe_config::monitor_poll_interval and forwarded in
 * arrival order. When the relay closes the connection the monitor performs one
 * last drain and stops on its own.
 *
 * @tparam Stream Transport satisfying concepts::websocket_stream
 */
template<concepts::websocket_stream Stream> class relay_monitor
{
public:
  relay_monitor(boost::asio::any_io_executor executor, session::stream_factory<Stream> factory, core::probe_config config)
    : executor_(std::move(executor)), factory_(std::move(factory)), config_(std::move(config))
  {}

  /**
   * @brief Starts monitoring a relay.
   *
   * If the connection cannot be established `on_status` receives
   * connection_state::error and `on_log` receives the failure entry.
   *
   * @param url Relay URI
   * @param on_log Receives every session log entry
   * @param on_status Receives every session state transition
   * @return Handle used to cancel the monitor
   */
  auto start(std::string url, log_handler_t on_log, status_handler_t on_status) -> monitor_handle
  {
    auto connection = std::make_shared<session::connection_session<Stream>>(factory_, url);
    auto poll_timer = std::make_shared<boost::asio::steady_timer>(executor_);

    auto control = std::make_shared<monitor_control>([executor = executor_, connection, poll_timer]() {
      boost::asio::post(executor, [connection, poll_timer]() {
        connection->close();
        poll_timer->cancel();
      });
    });

    connection->on_state_change([control, on_status](session::connection_state state) {
      control->deliver([&on_status, state]() { on_status(state); });
    });

    boost::asio::co_spawn(executor_,
      run(connection, poll_timer, control, std::move(on_log), config_),
      [control, url](std::exception_ptr error) {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception &e) {
            spdlog::error("[monitor] Monitor of {} stopped unexpectedly: {}", url, e.what());
          }
        }
        control->mark_finished();
      });

    spdlog::debug("[monitor] Started monitoring {}", url);
    return monitor_handle(control);
  }

private:
  using session_ptr = std::shared_ptr<session::connection_session<Stream>>;

  static auto forward(const session_ptr &connection, const std::shared_ptr<monitor_control> &control, const log_handler_t &on_log)
    -> void
  {
    const auto entries = connection->log().drain();
    if (entries.empty()) { return; }
    control->deliver([&entries, &on_log]() {
      for (const auto &entry : entries) { on_log(entry); }
    });
  }

  static auto run(session_ptr connection,
    std::shared_ptr<boost::asio::steady_timer> poll_timer,
    std::shared_ptr<monitor_control> control,
    log_handler_t on_log,
    core::probe_config config) -> boost::asio::awaitable<void>
  {
    if (control->cancelled()) { co_return; }

    try {
      co_await connection->open(config.connect_timeout);
    } catch (const session::connect_error &e) {
      spdlog::warn("[monitor] {}: {}", connection->url(), e.what());
      forward(connection, control, on_log);
      connection->close();
      co_return;
    }

    while (true) {
      poll_timer->expires_after(config.monitor_poll_interval);
      boost::system::error_code wait_error;
      co_await poll_timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));

      forward(connection, control, on_log);

      if (control->cancelled() or connection->state() != session::connection_state::connected) { break; }
    }

    connection->close();
    spdlog::debug("[monitor] Stopped monitoring {}", connection->url());
  }

  boost::asio::any_io_executor executor_;
  session::stream_factory<Stream> factory_;
  core::probe_config config_;
};

}// namespace relay_probe::monitor
