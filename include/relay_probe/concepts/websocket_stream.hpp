#pragma once

#include <utility>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <concepts>
#include <cstddef>
#include <functional>
#include <span>

namespace relay_probe::transport {
struct websocket_connection_params;
}

namespace relay_probe::concepts {

/**
 * @brief Concept defining the duplex stream a connection session drives.
 *
 * Types satisfying this concept provide callback-based connect, read, write and
 * close. A read completes with one whole message copied into the caller's buffer.
 */
template<typename T>
concept websocket_stream = requires(T &stream,
  const transport::websocket_connection_params params,
  const std::span<const std::byte> data,
  const boost::asio::mutable_buffer &buffer,
  std::function<void(const boost::system::error_code &, std::size_t)> handler) {
  { stream.async_connect(params, handler) } -> std::same_as<void>;
  { stream.async_write(data, handler) } -> std::same_as<void>;
  { stream.async_read(buffer, handler) } -> std::same_as<void>;
  { stream.async_close(handler) } -> std::same_as<void>;
};

}// namespace relay_probe::concepts
