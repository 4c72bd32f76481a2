#include <relay_probe/core/probe_config.hpp>
#include <relay_probe/nostr/protocol.hpp>
#include <relay_probe/transport/endpoint.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>

// Fuzzer that feeds arbitrary relay frames and addresses to the parsers
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string input(reinterpret_cast<const char *>(Data), Size);

  std::ignore = relay_probe::nostr::protocol::ok::deserialize(input);
  std::ignore = relay_probe::nostr::protocol::relay_document::deserialize(input);

  if (auto event = relay_probe::nostr::protocol::event_data::deserialize(input)) {
    std::ignore = relay_probe::nostr::protocol::event{ .data = *event }.serialize();
  }

  try {
    std::ignore = relay_probe::transport::endpoint::parse(input);
  } catch (const std::invalid_argument &) {
    // rejected addresses are expected
  }

  try {
    std::ignore = relay_probe::core::parse_probe_config(input);
  } catch (const std::invalid_argument &) {
    // malformed configuration is expected
  }

  return 0;
}
