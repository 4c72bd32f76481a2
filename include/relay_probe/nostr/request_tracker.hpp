#pragma once

#include <relay_probe/nostr/protocol.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace relay_probe::nostr {

/// Raised by request_tracker::async_track when no response arrives in time
class request_timeout : public std::runtime_error
{
public:
  request_timeout() : std::runtime_error("Request timeout") {}
};

/**
 * @brief Matches relay OK responses to the events awaiting them.
 *
 * Each tracked event id resolves at most once: the first OK carrying that id
 * wins, later ones and OKs for untracked ids are ignored.
 */
class request_tracker
{
private:
  struct pending_request
  {
    std::function<void(const protocol::ok &)> callback;
  };

public:
  /**
   * @brief Checks if an event ID has a pending request.
   *
   * @param event_id Event ID to check
   * @return true if pending, false otherwise
   */
  [[nodiscard]] auto has_pending(const std::string &event_id) const -> bool { return pending_.contains(event_id); }

  /**
   * @brief Resolves the request waiting for `response.event_id`.
   *
   * @param response OK frame received from the relay
   * @return true if a pending request was resolved
   */
  auto resolve(const protocol::ok &response) -> bool
  {
    auto iter = pending_.find(response.event_id);
    if (iter == pending_.end()) { return false; }

    auto callback = std::move(iter->second.callback);
    pending_.erase(iter);
    callback(response);
    return true;
  }

  /**
   * @brief Waits for the OK response of an event.
   *
   * @param event_id Event ID to track
   * @param timeout Maximum time to wait for response
   * @return Awaitable that yields the response
   * @throws request_timeout on timeout
   */
  [[nodiscard]] auto async_track(std::string event_id, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<protocol::ok>
  {
    auto executor = co_await boost::asio::this_coro::executor;
    auto timeout_timer = std::make_shared<boost::asio::steady_timer>(executor, timeout);
    auto result = std::make_shared<std::optional<protocol::ok>>();

    pending_[event_id] = pending_request{ .callback = [timeout_timer, result](const protocol::ok &response) {
      *result = response;
      timeout_timer->cancel();
    } };

    boost::system::error_code error_code;
    co_await timeout_timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error_code));

    pending_.erase(event_id);

    if (result->has_value()) { co_return std::move(**result); }

    throw request_timeout();
  }

private:
  std::unordered_map<std::string, pending_request> pending_;
};

}// namespace relay_probe::nostr
