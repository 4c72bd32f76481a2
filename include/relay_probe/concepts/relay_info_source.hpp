#pragma once

#include <relay_probe/core/results.hpp>

#include <boost/asio/awaitable.hpp>
#include <concepts>
#include <string>

namespace relay_probe::concepts {

/**
 * @brief Concept for a provider of NIP-11 relay information.
 *
 * Implementations never throw from fetch(); failures are reported through
 * relay_info::status and relay_info::error_message.
 */
template<typename T>
concept relay_info_source = requires(T &source, std::string url) {
  { source.fetch(url) } -> std::same_as<boost::asio::awaitable<core::relay_info>>;
};

}// namespace relay_probe::concepts
