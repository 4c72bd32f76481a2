#pragma once

#include <relay_probe/cli_utils/app_init.hpp>
#include <relay_probe/cli_utils/cli_parser.hpp>
#include <relay_probe/cli_utils/result_printer.hpp>
#include <relay_probe/concepts/relay_info_source.hpp>
#include <relay_probe/concepts/websocket_stream.hpp>
#include <relay_probe/core/probe_config.hpp>
#include <relay_probe/monitor/relay_monitor.hpp>
#include <relay_probe/probe/compliance_tester.hpp>
#include <relay_probe/probe/health_probe.hpp>
#include <relay_probe/publish/publish_coordinator.hpp>
#include <relay_probe/stress/stress_runner.hpp>

#include <algorithm>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace relay_probe::cli_utils {

/**
 * @brief Executes the selected subcommand and emits its rendered output.
 *
 * @tparam Stream Transport for relay sessions
 * @tparam Info Source of relay information documents
 */
template<concepts::websocket_stream Stream, concepts::relay_info_source Info> class command_runner
{
public:
  using output_t = std::function<void(const std::string &)>;

  command_runner(boost::asio::any_io_executor executor,
    session::stream_factory<Stream> factory,
    Info &info_source,
    core::probe_config config,
    output_t output)
    : executor_(std::move(executor)), factory_(std::move(factory)), info_source_(info_source),
      config_(std::move(config)), output_(std::move(output))
  {}

  /**
   * @brief Runs the command selected in `args`.
   *
   * @return Process exit code
   * @throws std::invalid_argument for unusable input such as an unreadable event file
   */
  auto execute(const cli_args &args) -> boost::asio::awaitable<int>
  {
    json_output_ = args.json_output;

    switch (args.selected) {
    case command::health: {
      probe::health_probe<Stream> health(factory_, config_);
      emit(co_await health.check(args.urls.front()));
      break;
    }
    case command::ping: {
      probe::health_probe<Stream> health(factory_, config_);
      emit(co_await health.ping(args.urls.front()));
      break;
    }
    case command::info:
      emit(co_await info_source_.fetch(args.urls.front()));
      break;
    case command::compliance: {
      probe::compliance_tester<Stream, Info> tester(factory_, info_source_, config_);
      emit(co_await tester.test_compliance(args.urls.front()));
      break;
    }
    case command::compare: {
      probe::compliance_tester<Stream, Info> tester(factory_, info_source_, config_);
      auto results = co_await tester.compare(args.urls.empty() ? config_.default_relays : args.urls);
      sort_by_latency(results);
      if (json_output_) {
        output_(nlohmann::json(results).dump(2) + "\n");
      } else {
        output_(format_comparison(results));
      }
      break;
    }
    case command::publish: {
      publish::publish_coordinator<Stream> coordinator(factory_, config_);
      emit(co_await coordinator.publish(args.urls.front(), read_signed_event(args.event_source)));
      break;
    }
    case command::batch_publish: {
      publish::publish_coordinator<Stream> coordinator(factory_, config_);
      const auto results = co_await coordinator.batch_publish(args.urls, read_signed_event(args.event_source));
      if (json_output_) {
        output_(nlohmann::json(results).dump(2) + "\n");
      } else {
        for (const auto &result : results) { output_(format_result(result)); }
      }
      break;
    }
    case command::stress: {
      stress::stress_runner<Stream> runner(factory_, config_);
      emit(co_await runner.run(
        args.urls.front(), args.connection_count, std::chrono::milliseconds(args.duration_ms)));
      break;
    }
    case command::monitor:
      co_await run_monitor(args);
      break;
    case command::none:
      co_return 1;
    }

    co_return 0;
  }

  /// Ends a running monitor command; called from the signal handler.
  auto request_stop() -> void
  {
    stop_requested_ = true;
    if (stop_timer_) { stop_timer_->cancel(); }
  }

private:
  template<typename Result> auto emit(const Result &result) -> void
  {
    if (json_output_) {
      output_(nlohmann::json(result).dump(2) + "\n");
    } else {
      output_(format_result(result));
    }
  }

  auto run_monitor(const cli_args &args) -> boost::asio::awaitable<void>
  {
    monitor::relay_monitor<Stream> relay_monitor(executor_, factory_, config_);
    auto handle = relay_monitor.start(
      args.urls.front(),
      [this](const session::log_entry &entry) {
        if (json_output_) {
          output_(nlohmann::json(entry).dump() + "\n");
        } else {
          output_(format_log_entry(entry));
        }
      },
      [this](session::connection_state state) {
        if (not json_output_) { output_(format_status(state)); }
      });

    const auto deadline = args.monitor_for_ms
                            ? std::chrono::steady_clock::now() + std::chrono::milliseconds(*args.monitor_for_ms)
                            : std::chrono::steady_clock::time_point::max();

    stop_timer_ = std::make_shared<boost::asio::steady_timer>(executor_);
    while (not stop_requested_ and not handle.finished() and std::chrono::steady_clock::now() < deadline) {
      stop_timer_->expires_at(std::min(deadline, std::chrono::steady_clock::now() + config_.monitor_poll_interval));
      boost::system::error_code wait_error;
      co_await stop_timer_->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));
    }
    stop_timer_.reset();

    handle.cancel();
  }

  boost::asio::any_io_executor executor_;
  session::stream_factory<Stream> factory_;
  Info &info_source_;
  core::probe_config config_;
  output_t output_;
  bool json_output_{ false };
  bool stop_requested_{ false };
  std::shared_ptr<boost::asio::steady_timer> stop_timer_;
};

}// namespace relay_probe::cli_utils
