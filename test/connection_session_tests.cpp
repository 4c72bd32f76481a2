#include "test_doubles/test_double_websocket_stream.hpp"
#include "test_support.hpp"

#include <relay_probe/session/connection_session.hpp>

#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace relay_probe::session::test {

using relay_probe::test::relay_record;
using relay_probe::test::relay_script;
using relay_probe::test::scripted_frame;
using relay_probe::test::test_double_websocket_stream;
using session_t = connection_session<test_double_websocket_stream>;

namespace {
  struct fixture
  {
    std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
    std::shared_ptr<relay_script> script = std::make_shared<relay_script>();
    std::shared_ptr<relay_record> record = std::make_shared<relay_record>();
    std::vector<std::shared_ptr<session_t>> sessions;

    fixture() = default;
    fixture(const fixture &) = delete;
    auto operator=(const fixture &) -> fixture & = delete;
    fixture(fixture &&) = delete;
    auto operator=(fixture &&) -> fixture & = delete;

    ~fixture()
    {
      for (const auto &connection : sessions) { connection->close(); }
      io_context->restart();
      io_context->run();
    }

    auto make_session(std::string url = "wss://relay.test") -> std::shared_ptr<session_t>
    {
      sessions.push_back(
        std::make_shared<session_t>(relay_probe::test::make_test_factory(io_context, script, record), std::move(url)));
      return sessions.back();
    }
  };

  auto open_and_capture(std::shared_ptr<session_t> connection, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::string>
  {
    try {
      co_await connection->open(timeout);
    } catch (const connect_error &e) {
      co_return std::string(e.what());
    }
    co_return std::string{};
  }

  auto count_kind(const std::vector<log_entry> &entries, log_kind kind) -> std::size_t
  {
    return static_cast<std::size_t>(
      std::ranges::count_if(entries, [kind](const log_entry &entry) { return entry.kind == kind; }));
  }
}// namespace

SCENARIO("connection_session opens against an accepting relay", "[session][connection_session]")
{
  GIVEN("A relay that accepts connections")
  {
    fixture env;
    auto connection = env.make_session("ws://localhost:7777/relay");
    std::vector<connection_state> states;
    connection->on_state_change([&states](connection_state state) { states.push_back(state); });

    WHEN("the session is opened")
    {
      auto error = relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(1)));

      THEN("it reaches connected through connecting")
      {
        CHECK(error.empty());
        CHECK(connection->state() == connection_state::connected);
        CHECK(states == std::vector<connection_state>{ connection_state::connecting, connection_state::connected });
      }

      THEN("the transport saw the parsed endpoint")
      {
        REQUIRE(env.record->connections.size() == 1);
        CHECK(env.record->connections[0].host == "localhost");
        CHECK(env.record->connections[0].port == "7777");
        CHECK(env.record->connections[0].path == "/relay");
        CHECK_FALSE(env.record->connections[0].secure);
      }

      THEN("every transition was logged")
      {
        const auto entries = connection->log().snapshot();
        REQUIRE(entries.size() == 2);
        CHECK(entries[1].message == "Connected to relay");
      }

      connection->close();
    }
  }
}

SCENARIO("connection_session reports connect failures", "[session][connection_session]")
{
  GIVEN("A relay that never completes the handshake")
  {
    fixture env;
    env.script->never_connect = true;
    auto connection = env.make_session();

    WHEN("the session is opened with a short timeout")
    {
      const auto start = std::chrono::steady_clock::now();
      auto error =
        relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::milliseconds(50)));
      const auto elapsed = std::chrono::steady_clock::now() - start;

      THEN("the timeout wins and the session is in error")
      {
        CHECK(error == "Connection timeout");
        CHECK(connection->state() == connection_state::error);
        CHECK(connection->errors() == 1);
        CHECK(elapsed < std::chrono::milliseconds(1000));
        CHECK(count_kind(connection->log().snapshot(), log_kind::error) == 1);
      }
    }
  }

  GIVEN("A relay that refuses connections")
  {
    fixture env;
    env.script->fail_connect = true;
    auto connection = env.make_session();

    WHEN("the session is opened")
    {
      auto error = relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(1)));

      THEN("the transport error is reported")
      {
        CHECK(error.starts_with("Connection failed:"));
        CHECK(connection->state() == connection_state::error);
      }
    }
  }

  GIVEN("A transport that cannot be constructed")
  {
    fixture env;
    env.script->factory_throws = true;
    auto connection = env.make_session();

    WHEN("the session is opened")
    {
      auto error = relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(1)));

      THEN("it is a connect failure")
      {
        CHECK(error == "Connection failed: transport unavailable");
        CHECK(connection->state() == connection_state::error);
      }
    }
  }

  GIVEN("An address with an unsupported scheme")
  {
    fixture env;
    auto connection = env.make_session("https://relay.test");

    THEN("open fails without touching the transport")
    {
      auto error = relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(1)));
      CHECK(error.starts_with("Connection failed:"));
      CHECK(env.record->streams_created == 0);
    }
  }
}

SCENARIO("connection_session settles the open race exactly once", "[session][connection_session]")
{
  GIVEN("A handshake that completes after the timeout")
  {
    fixture env;
    env.script->connect_delay = std::chrono::milliseconds(100);
    auto connection = env.make_session();
    std::vector<connection_state> states;
    connection->on_state_change([&states](connection_state state) { states.push_back(state); });

    WHEN("the session is opened with a 20 ms timeout")
    {
      auto error =
        relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::milliseconds(20)));

      THEN("the late handshake does not revive the session")
      {
        CHECK(error == "Connection timeout");
        CHECK(connection->state() == connection_state::error);
        CHECK(states == std::vector<connection_state>{ connection_state::connecting, connection_state::error });
      }
    }
  }
}

SCENARIO("connection_session sends and receives frames", "[session][connection_session]")
{
  GIVEN("A connected session with an echoing relay")
  {
    fixture env;
    env.script->responder = [](const std::string &frame) {
      return std::vector<scripted_frame>{ { .text = "echo:" + frame } };
    };
    auto connection = env.make_session();
    std::vector<std::string> received;
    connection->on_message([&received](const std::string &frame) { received.push_back(frame); });
    relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(1)));

    WHEN("two frames are sent")
    {
      CHECK(connection->send("one"));
      CHECK(connection->send("two"));
      env.io_context->restart();
      env.io_context->run_for(std::chrono::milliseconds(50));

      THEN("writes happen in order and replies reach observers")
      {
        CHECK(env.record->writes == std::vector<std::string>{ "one", "two" });
        CHECK(received == std::vector<std::string>{ "echo:one", "echo:two" });
        CHECK(connection->messages_received() == 2);
      }

      THEN("each send and receive was logged with its payload")
      {
        const auto entries = connection->log().snapshot();
        CHECK(count_kind(entries, log_kind::sent) == 2);
        CHECK(count_kind(entries, log_kind::received) == 2);
      }

      connection->close();
    }
  }

  GIVEN("A session that was never opened")
  {
    fixture env;
    auto connection = env.make_session();

    THEN("send is refused and logged as an error")
    {
      CHECK_FALSE(connection->send("frame"));
      CHECK(env.record->writes.empty());
      CHECK(count_kind(connection->log().snapshot(), log_kind::error) == 1);
    }
  }
}

SCENARIO("connection_session flags frames cut at the read limit", "[session][connection_session]")
{
  GIVEN("A relay that pushes a frame larger than 64 KiB")
  {
    constexpr std::size_t read_limit = 65536;
    fixture env;
    env.script->on_connect = { { .text = std::string(read_limit + 100, 'x') }, { .text = "small" } };
    auto connection = env.make_session();
    relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(1)));

    WHEN("the frames have been read")
    {
      env.io_context->restart();
      env.io_context->run_for(std::chrono::milliseconds(50));
      const auto entries = connection->log().snapshot();

      THEN("the large payload is cut and an info entry says so")
      {
        const auto received = std::ranges::find_if(
          entries, [](const log_entry &entry) { return entry.kind == log_kind::received; });
        REQUIRE(received != entries.end());
        REQUIRE(received->payload.has_value());
        CHECK(received->payload->size() == read_limit);

        REQUIRE(std::next(received) != entries.end());
        CHECK(std::next(received)->kind == log_kind::info);
        CHECK(std::next(received)->message.find("truncated") != std::string::npos);
      }

      THEN("a small frame gets no truncation entry")
      {
        CHECK(count_kind(entries, log_kind::received) == 2);
        CHECK(std::ranges::count_if(entries, [](const log_entry &entry) {
          return entry.message.find("truncated") != std::string::npos;
        }) == 1);
      }

      connection->close();
    }
  }
}

SCENARIO("connection_session close is idempotent", "[session][connection_session]")
{
  GIVEN("A connected session")
  {
    fixture env;
    auto connection = env.make_session();
    int disconnects = 0;
    int close_notifications = 0;
    connection->on_state_change([&disconnects](connection_state state) {
      if (state == connection_state::disconnected) { ++disconnects; }
    });
    connection->on_close([&close_notifications]() { ++close_notifications; });
    relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(1)));

    WHEN("close is called twice")
    {
      connection->close();
      connection->close();
      env.io_context->restart();
      env.io_context->run();

      THEN("exactly one transition to disconnected happens")
      {
        CHECK(connection->state() == connection_state::disconnected);
        CHECK(disconnects == 1);
        CHECK(close_notifications == 1);
        CHECK(env.record->closes == 1);
      }

      THEN("sending afterwards fails") { CHECK_FALSE(connection->send("late")); }
    }
  }

  GIVEN("A session that is still connecting")
  {
    fixture env;
    env.script->never_connect = true;
    auto connection = env.make_session();

    WHEN("close is called while open is pending")
    {
      auto close_timer = std::make_shared<boost::asio::steady_timer>(*env.io_context, std::chrono::milliseconds(10));
      close_timer->async_wait([connection, close_timer](const boost::system::error_code &) { connection->close(); });

      auto error = relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(5)));

      THEN("open fails promptly and the session ends disconnected")
      {
        CHECK(error == "Session closed while connecting");
        CHECK(connection->state() == connection_state::disconnected);
      }
    }
  }
}

SCENARIO("connection_session follows the relay closing the connection", "[session][connection_session]")
{
  GIVEN("A relay that closes cleanly after 20 ms")
  {
    fixture env;
    env.script->relay_closes_after = std::chrono::milliseconds(20);
    auto connection = env.make_session();
    bool closed = false;
    int errors = 0;
    connection->on_close([&closed]() { closed = true; });
    connection->on_error([&errors](const std::string &) { ++errors; });

    WHEN("the session runs")
    {
      relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(1)));
      env.io_context->restart();
      env.io_context->run();

      THEN("it is disconnected without errors")
      {
        CHECK(closed);
        CHECK(errors == 0);
        CHECK(connection->state() == connection_state::disconnected);
      }
    }
  }

  GIVEN("A relay whose connection breaks")
  {
    fixture env;
    env.script->relay_fails_after = std::chrono::milliseconds(20);
    auto connection = env.make_session();
    std::vector<std::string> errors;
    connection->on_error([&errors](const std::string &message) { errors.push_back(message); });

    WHEN("the session runs")
    {
      relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(1)));
      env.io_context->restart();
      env.io_context->run();

      THEN("error observers are told before the session disconnects")
      {
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].starts_with("WebSocket error:"));
        CHECK(connection->errors() == 1);
        CHECK(connection->state() == connection_state::disconnected);
      }
    }
  }
}

SCENARIO("connection_session observers can be removed", "[session][connection_session]")
{
  GIVEN("Two message observers")
  {
    fixture env;
    env.script->on_connect = { { .text = "hello" } };
    auto connection = env.make_session();
    int first = 0;
    int second = 0;
    const auto first_id = connection->on_message([&first](const std::string &) { ++first; });
    connection->on_message([&second](const std::string &) { ++second; });

    WHEN("the first is removed before the frame arrives")
    {
      connection->remove_observer(first_id);
      relay_probe::test::run_awaitable(env.io_context, open_and_capture(connection, std::chrono::seconds(1)));
      env.io_context->restart();
      env.io_context->run_for(std::chrono::milliseconds(20));

      THEN("only the second sees it")
      {
        CHECK(first == 0);
        CHECK(second == 1);
      }

      connection->close();
    }
  }
}

}// namespace relay_probe::session::test
