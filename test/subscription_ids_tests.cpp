#include <relay_probe/core/subscription_ids.hpp>
#include <relay_probe/nostr/protocol.hpp>

#include <catch2/catch_test_macros.hpp>
#include <string>

TEST_CASE("make_subscription_id produces unique prefixed ids", "[core][subscription_ids]")
{
  const auto first = relay_probe::core::make_subscription_id("health_check");
  const auto second = relay_probe::core::make_subscription_id("health_check");

  CHECK(first.starts_with("health_check_"));
  CHECK(first != second);
  CHECK_NOTHROW(relay_probe::nostr::protocol::validate_subscription_id(first));
}

TEST_CASE("make_subscription_id stays within the protocol limit", "[core][subscription_ids]")
{
  const auto id = relay_probe::core::make_subscription_id(std::string(100, 'p'));

  CHECK(id.size() <= relay_probe::nostr::protocol::max_subscription_id_length);
  CHECK_NOTHROW(relay_probe::nostr::protocol::validate_subscription_id(id));
}
