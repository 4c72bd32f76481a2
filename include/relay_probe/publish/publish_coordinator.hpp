#pragma once

#include <relay_probe/async/join_all.hpp>
#include <relay_probe/concepts/websocket_stream.hpp>
#include <relay_probe/core/probe_config.hpp>
#include <relay_probe/core/results.hpp>
#include <relay_probe/nostr/protocol.hpp>
#include <relay_probe/nostr/request_tracker.hpp>
#include <relay_probe/platform/time_utils.hpp>
#include <relay_probe/session/connection_session.hpp>

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace relay_probe::publish {

/**
 * @brief Publishes already-signed events and correlates the relay's OK acknowledgement.
 *
 * @tparam Stream Transport satisfying concepts::websocket_stream
 */
template<concepts::websocket_stream Stream> class publish_coordinator
{
public:
  publish_coordinator(session::stream_factory<Stream> factory, core::probe_config config)
    : factory_(std::move(factory)), config_(std::move(config))
  {}

  /**
   * @brief Publishes one event to one relay.
   *
   * The first OK frame carrying the event's id decides the outcome; frames that
   * are not OK frames, OKs for other ids and malformed frames are ignored.
   * The session is closed on every path.
   *
   * @param url Relay URI
   * @param event Signed event
   * @return Publish result; never throws
   */
  auto publish(std::string url, nostr::protocol::event_data event) -> boost::asio::awaitable<core::publish_result>
  {
    const auto start = std::chrono::steady_clock::now();
    core::publish_result result{ .relay = url, .event_id = event.id, .timestamp = platform::unix_time_millis() };

    auto connection = std::make_shared<session::connection_session<Stream>>(factory_, url);
    auto tracker = std::make_shared<nostr::request_tracker>();

    try {
      co_await connection->open(config_.connect_timeout);

      connection->on_message([tracker](const std::string &frame) {
        if (auto response = nostr::protocol::ok::deserialize(frame)) { tracker->resolve(*response); }
      });

      const auto event_id = event.id;
      if (not connection->send(nostr::protocol::event{ .data = std::move(event) }.serialize())) {
        throw std::runtime_error("Connection lost before the event was sent");
      }

      const auto response = co_await tracker->async_track(event_id, config_.publish_timeout);
      result.success = response.accepted;
      result.message = response.message.empty() ? std::string("Event published") : response.message;
    } catch (const session::connect_error &e) {
      result.message = e.what();
    } catch (const nostr::request_timeout &) {
      result.message = "Publish timeout";
      spdlog::warn("[publish] No acknowledgement from {} for {}", url, result.event_id);
    } catch (const std::exception &e) {
      result.message = e.what();
      spdlog::warn("[publish] {} on {}", e.what(), url);
    }

    result.latency_ms = platform::elapsed_millis(start);
    connection->close();

    spdlog::info("[publish] {} event={} success={} latency={:.1f}ms", url, result.event_id, result.success, result.latency_ms);
    co_return result;
  }

  /**
   * @brief Publishes the same event to several relays concurrently.
   *
   * @param urls Relay URIs
   * @param event Signed event
   * @return One result per URI, in input order
   */
  auto batch_publish(std::vector<std::string> urls, nostr::protocol::event_data event)
    -> boost::asio::awaitable<std::vector<core::publish_result>>
  {
    std::vector<boost::asio::awaitable<core::publish_result>> tasks;
    tasks.reserve(urls.size());
    for (auto &url : urls) { tasks.push_back(publish(std::move(url), event)); }

    co_return co_await async::join_all(std::move(tasks));
  }

private:
  session::stream_factory<Stream> factory_;
  core::probe_config config_;
};

}// namespace relay_probe::publish
