#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <memory>
#include <utility>

namespace relay_probe::test {

/// Runs the io_context until `task` and everything it started have finished.
template<typename T>
auto run_awaitable(const std::shared_ptr<boost::asio::io_context> &io_context, boost::asio::awaitable<T> task) -> T
{
  auto future = boost::asio::co_spawn(*io_context, std::move(task), boost::asio::use_future);
  io_context->restart();
  io_context->run();
  return future.get();
}

}// namespace relay_probe::test
