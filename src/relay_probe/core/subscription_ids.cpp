#include <relay_probe/core/subscription_ids.hpp>
#include <relay_probe/nostr/protocol.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace relay_probe::core {

auto make_subscription_id(std::string_view prefix) -> std::string
{
  static thread_local boost::uuids::random_generator gen;
  auto suffix = boost::uuids::to_string(gen());

  const auto max_prefix = nostr::protocol::max_subscription_id_length - suffix.size() - 1;
  if (prefix.size() > max_prefix) { prefix = prefix.substr(0, max_prefix); }

  if (prefix.empty()) { return suffix; }
  return std::string(prefix) + "_" + suffix;
}

}// namespace relay_probe::core
