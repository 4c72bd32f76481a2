#pragma once

#include <relay_probe/concepts/websocket_stream.hpp>
#include <relay_probe/session/activity_log.hpp>
#include <relay_probe/session/connection_state.hpp>
#include <relay_probe/transport/endpoint.hpp>
#include <relay_probe/transport/websocket_stream.hpp>

#include <algorithm>
#include <array>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/websocket/error.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fmt/format.h>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace relay_probe::session {

/// Raised by connection_session::open when no connection could be established
class connect_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// Creates the transport for one session; may throw
template<typename Stream> using stream_factory = std::function<std::shared_ptr<Stream>()>;

/**
 * @brief One duplex connection to one relay, with lifecycle state and an audit log.
 *
 * Every send, receive, error and state transition appends exactly one entry to
 * the activity log. Observers are kept in explicit per-session lists and are
 * all dropped when the session closes, so no callback fires after teardown.
 *
 * Sessions must be owned through std::shared_ptr; in-flight transport
 * operations keep the session alive until they complete. All member functions
 * must be called from the thread running the session's executor.
 *
 * @tparam Stream Transport satisfying concepts::websocket_stream
 */
template<concepts::websocket_stream Stream>
class connection_session : public std::enable_shared_from_this<connection_session<Stream>>
{
public:
  using observer_id = std::uint64_t;
  using message_handler_t = std::function<void(const std::string &)>;
  using close_handler_t = std::function<void()>;
  using error_handler_t = std::function<void(const std::string &)>;
  using state_handler_t = std::function<void(connection_state)>;

  connection_session(stream_factory<Stream> factory, std::string url)
    : factory_(std::move(factory)), url_(std::move(url)), last_activity_(std::chrono::steady_clock::now())
  {}

  connection_session(const connection_session &) = delete;
  auto operator=(const connection_session &) -> connection_session & = delete;
  connection_session(connection_session &&) = delete;
  auto operator=(connection_session &&) -> connection_session & = delete;
  ~connection_session() = default;

  /**
   * @brief Opens the connection, racing the transport handshake against a timeout.
   *
   * Whichever of {open, transport error, timeout} settles first decides the
   * outcome; the other is ignored. On failure the session is left in
   * connection_state::error.
   *
   * @param timeout Maximum time to reach connection_state::connected
   * @throws connect_error if the endpoint is invalid, the transport cannot be
   *         created, the handshake fails, the timeout elapses or the session is
   *         closed while connecting
   */
  auto open(std::chrono::milliseconds timeout) -> boost::asio::awaitable<void>
  {
    if (state_ != connection_state::disconnected or stream_) { throw connect_error("Session already opened"); }

    auto self = this->shared_from_this();
    auto executor = co_await boost::asio::this_coro::executor;

    transition(connection_state::connecting, log_kind::info, fmt::format("Connecting to {}", url_));

    transport::endpoint target;
    try {
      target = transport::endpoint::parse(url_);
      stream_ = factory_();
      if (not stream_) { throw std::runtime_error("transport factory returned no stream"); }
    } catch (const std::exception &e) {
      stream_.reset();
      fail(fmt::format("Connection failed: {}", e.what()));
      throw connect_error(fmt::format("Connection failed: {}", e.what()));
    }

    connect_timer_ = std::make_shared<boost::asio::steady_timer>(executor, timeout);

    stream_->async_connect(
      { .host = target.host, .port = target.port, .path = target.path, .secure = target.secure },
      [self](const boost::system::error_code &error_code, std::size_t /*bytes*/) {
        if (self->connect_settled_) { return; }
        self->connect_settled_ = true;
        self->connect_outcome_ = error_code;
        if (self->connect_timer_) { self->connect_timer_->cancel(); }
      });

    boost::system::error_code wait_error;
    co_await connect_timer_->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));
    connect_timer_.reset();

    if (state_ != connection_state::connecting) { throw connect_error("Session closed while connecting"); }

    if (not connect_settled_) {
      connect_settled_ = true;
      fail("Connection timeout");
      throw connect_error("Connection timeout");
    }

    if (connect_outcome_ and *connect_outcome_) {
      auto message = connect_outcome_->message();
      fail(fmt::format("Connection failed: {}", message));
      throw connect_error(fmt::format("Connection failed: {}", message));
    }

    transition(connection_state::connected, log_kind::info, "Connected to relay");
    spdlog::debug("[session] Connected to {}", url_);
    start_read();
  }

  /**
   * @brief Queues one text frame for sending.
   *
   * @param frame Serialized frame
   * @return false (and an error log entry) when the session is not connected
   */
  auto send(std::string frame) -> bool
  {
    if (state_ != connection_state::connected) {
      log_.append(log_kind::error, fmt::format("Cannot send while {}", to_string(state_)), std::move(frame));
      return false;
    }

    last_activity_ = std::chrono::steady_clock::now();
    log_.append(log_kind::sent, "Message sent", frame);
    outbound_.push_back(std::make_shared<std::string>(std::move(frame)));
    if (not writing_) { write_next(); }
    return true;
  }

  /**
   * @brief Closes the session. Idempotent and safe from any state.
   *
   * Transitions to connection_state::disconnected at most once, notifies close
   * observers, then drops every observer.
   */
  auto close() -> void
  {
    if (state_ == connection_state::disconnected) {
      clear_observers();
      return;
    }

    if (state_ == connection_state::connecting) {
      connect_settled_ = true;
      if (connect_timer_) { connect_timer_->cancel(); }
    }

    transition(connection_state::disconnected, log_kind::info, "Connection closed");
    notify(close_observers_);
    clear_observers();
    release_stream();
  }

  auto on_message(message_handler_t handler) -> observer_id
  {
    return add_observer(message_observers_, std::move(handler));
  }
  auto on_close(close_handler_t handler) -> observer_id { return add_observer(close_observers_, std::move(handler)); }
  auto on_error(error_handler_t handler) -> observer_id { return add_observer(error_observers_, std::move(handler)); }
  auto on_state_change(state_handler_t handler) -> observer_id
  {
    return add_observer(state_observers_, std::move(handler));
  }

  /// Unregisters an observer of any kind; unknown ids are ignored.
  auto remove_observer(observer_id id) -> void
  {
    erase_observer(message_observers_, id);
    erase_observer(close_observers_, id);
    erase_observer(error_observers_, id);
    erase_observer(state_observers_, id);
  }

  [[nodiscard]] auto url() const -> const std::string & { return url_; }
  [[nodiscard]] auto state() const -> connection_state { return state_; }
  [[nodiscard]] auto messages_received() const -> std::uint64_t { return messages_received_; }
  [[nodiscard]] auto errors() const -> std::uint64_t { return errors_; }
  [[nodiscard]] auto last_activity() const -> std::chrono::steady_clock::time_point { return last_activity_; }
  [[nodiscard]] auto log() -> activity_log & { return log_; }
  [[nodiscard]] auto log() const -> const activity_log & { return log_; }

private:
  template<typename Handler> struct observer
  {
    observer_id id;
    Handler handler;
  };

  template<typename Handler> using observer_list = std::vector<observer<Handler>>;

  static constexpr std::size_t read_buffer_size = 65536;

  stream_factory<Stream> factory_;
  std::string url_;
  std::shared_ptr<Stream> stream_;
  connection_state state_{ connection_state::disconnected };
  std::uint64_t messages_received_{ 0 };
  std::uint64_t errors_{ 0 };
  std::chrono::steady_clock::time_point last_activity_;
  activity_log log_;

  std::shared_ptr<boost::asio::steady_timer> connect_timer_;
  bool connect_settled_{ false };
  std::optional<boost::system::error_code> connect_outcome_;

  std::deque<std::shared_ptr<std::string>> outbound_;
  bool writing_{ false };
  bool stream_released_{ false };
  bool close_after_write_{ false };
  std::array<std::byte, read_buffer_size> read_buffer_{};

  observer_id next_observer_id_{ 1 };
  observer_list<message_handler_t> message_observers_;
  observer_list<close_handler_t> close_observers_;
  observer_list<error_handler_t> error_observers_;
  observer_list<state_handler_t> state_observers_;

  auto transition(connection_state next, log_kind kind, std::string message) -> void
  {
    if (state_ == next) { return; }
    state_ = next;
    last_activity_ = std::chrono::steady_clock::now();
    log_.append(kind, std::move(message));
    notify(state_observers_, next);
  }

  auto fail(std::string message) -> void
  {
    ++errors_;
    transition(connection_state::error, log_kind::error, std::move(message));
    release_stream();
  }

  auto start_read() -> void
  {
    auto self = this->shared_from_this();
    stream_->async_read(boost::asio::buffer(read_buffer_),
      [self](const boost::system::error_code &error, std::size_t bytes_transferred) {
        self->process_read(error, bytes_transferred);
      });
  }

  auto process_read(const boost::system::error_code &error, std::size_t bytes_transferred) -> void
  {
    if (state_ != connection_state::connected) { return; }

    if (error) {
      handle_transport_closed(error);
      return;
    }

    std::string frame(bytes_transferred, '\0');
    std::ranges::transform(std::span(read_buffer_).first(bytes_transferred), frame.begin(), [](std::byte byte_val) {
      return static_cast<char>(byte_val);
    });

    ++messages_received_;
    last_activity_ = std::chrono::steady_clock::now();
    log_.append(log_kind::received, "Message received", frame);
    if (bytes_transferred == read_buffer_size) {
      log_.append(log_kind::info, fmt::format("Frame reached the {} byte read limit and was truncated", read_buffer_size));
    }
    notify(message_observers_, frame);

    if (state_ == connection_state::connected) { start_read(); }
  }

  auto handle_transport_closed(const boost::system::error_code &error) -> void
  {
    const bool clean_close =
      error == boost::beast::websocket::error::closed or error == boost::asio::error::eof;

    if (not clean_close) {
      ++errors_;
      auto message = fmt::format("WebSocket error: {}", error.message());
      spdlog::debug("[session] {} on {}", message, url_);
      transition(connection_state::error, log_kind::error, message);
      notify(error_observers_, message);
    }

    transition(connection_state::disconnected, log_kind::info, "Connection closed");
    notify(close_observers_);
    clear_observers();
    release_stream();
  }

  auto write_next() -> void
  {
    if (outbound_.empty() or state_ != connection_state::connected) {
      outbound_.clear();
      writing_ = false;
      if (close_after_write_) {
        close_after_write_ = false;
        close_stream();
      }
      return;
    }

    writing_ = true;
    auto self = this->shared_from_this();
    auto frame = outbound_.front();
    stream_->async_write(
      std::as_bytes(std::span(*frame)), [self, frame](const boost::system::error_code &error, std::size_t /*bytes*/) {
        self->outbound_.pop_front();
        if (error and self->state_ == connection_state::connected) {
          ++self->errors_;
          auto message = fmt::format("Send failed: {}", error.message());
          self->log_.append(log_kind::error, message, *frame);
          self->notify(self->error_observers_, message);
        }
        self->write_next();
      });
  }

  auto release_stream() -> void
  {
    if (not stream_ or stream_released_) { return; }
    stream_released_ = true;

    if (writing_) {
      close_after_write_ = true;
      return;
    }
    close_stream();
  }

  auto close_stream() -> void
  {
    auto self = this->shared_from_this();
    stream_->async_close([self](const boost::system::error_code &error, std::size_t /*bytes*/) {
      if (error) { spdlog::trace("[session] Close of {} reported: {}", self->url_, error.message()); }
    });
  }

  template<typename Handler> auto add_observer(observer_list<Handler> &list, Handler handler) -> observer_id
  {
    const auto id = next_observer_id_++;
    list.push_back(observer<Handler>{ .id = id, .handler = std::move(handler) });
    return id;
  }

  template<typename Handler> static auto erase_observer(observer_list<Handler> &list, observer_id id) -> void
  {
    std::erase_if(list, [id](const observer<Handler> &entry) { return entry.id == id; });
  }

  template<typename Handler> static auto is_registered(const observer_list<Handler> &list, observer_id id) -> bool
  {
    return std::ranges::any_of(list, [id](const observer<Handler> &entry) { return entry.id == id; });
  }

  /// Invokes a snapshot of the list, skipping observers removed by an earlier callback.
  template<typename Handler, typename... Args> auto notify(observer_list<Handler> &list, const Args &...args) -> void
  {
    auto snapshot = list;
    for (auto &entry : snapshot) {
      if (is_registered(list, entry.id)) { entry.handler(args...); }
    }
  }

  auto clear_observers() -> void
  {
    message_observers_.clear();
    close_observers_.clear();
    error_observers_.clear();
    state_observers_.clear();
  }
};

/**
 * @brief Factory creating production WebSocket streams on an io_context.
 */
[[nodiscard]] inline auto make_websocket_factory(const std::shared_ptr<boost::asio::io_context> &io_context)
  -> stream_factory<transport::websocket_stream>
{
  return [io_context]() { return std::make_shared<transport::websocket_stream>(*io_context); };
}

}// namespace relay_probe::session
