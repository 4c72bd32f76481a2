#include "test_support.hpp"

#include <relay_probe/nostr/relay_info_client.hpp>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using namespace std::chrono_literals;
using relay_probe::nostr::relay_info_client;
using relay_probe::session::connection_state;

namespace {
using results_t = boost::asio::ip::tcp::resolver::results_type;

auto stalled_resolver(std::chrono::milliseconds stall) -> relay_info_client::resolver_fn
{
  return [stall](std::string, std::string) -> boost::asio::awaitable<results_t> {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor, stall);
    co_await timer.async_wait(boost::asio::use_awaitable);
    throw std::runtime_error("lookup finished late");
  };
}

auto timed_fetch(relay_info_client &client, std::string url)
  -> boost::asio::awaitable<std::pair<relay_probe::core::relay_info, std::chrono::steady_clock::duration>>
{
  const auto start = std::chrono::steady_clock::now();
  auto info = co_await client.fetch(std::move(url));
  co_return std::make_pair(std::move(info), std::chrono::steady_clock::now() - start);
}
}// namespace

SCENARIO("relay_info_client bounds the metadata fetch by its timeout", "[nostr][nip11]")
{
  GIVEN("a host name lookup that stalls well past the timeout")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    relay_info_client client(50ms, stalled_resolver(400ms));

    WHEN("the document is fetched")
    {
      auto [info, elapsed] = relay_probe::test::run_awaitable(io_context, timed_fetch(client, "wss://relay.example"));

      THEN("the fetch fails at the deadline instead of waiting for the lookup")
      {
        CHECK(info.status == connection_state::error);
        REQUIRE(info.error_message.has_value());
        CHECK(info.error_message->find("timed out") != std::string::npos);
        CHECK(elapsed < 300ms);
      }
    }
  }

  GIVEN("a host name lookup that fails")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    relay_info_client client(1000ms, [](std::string, std::string) -> boost::asio::awaitable<results_t> {
      throw std::runtime_error("Host not found");
      co_return results_t{};
    });

    WHEN("the document is fetched")
    {
      auto info = relay_probe::test::run_awaitable(io_context, client.fetch("ws://relay.example"));

      THEN("the lookup error is reported as the fetch error")
      {
        CHECK(info.url == "ws://relay.example");
        CHECK(info.status == connection_state::error);
        CHECK(info.error_message == "Host not found");
      }
    }
  }

  GIVEN("a URI with an unsupported scheme")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    relay_info_client client(1000ms, stalled_resolver(10ms));

    WHEN("the document is fetched")
    {
      auto info = relay_probe::test::run_awaitable(io_context, client.fetch("https://relay.example"));

      THEN("the fetch fails without resolving")
      {
        CHECK(info.status == connection_state::error);
        CHECK(info.error_message.has_value());
      }
    }
  }
}
