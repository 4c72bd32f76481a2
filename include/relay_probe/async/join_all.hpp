#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <vector>

namespace relay_probe::async {

/**
 * @brief Runs every task concurrently and waits for all of them.
 *
 * Each task is spawned on the calling coroutine's executor and writes exactly
 * one result slot, so the returned vector is in input order regardless of
 * completion order. A task that throws leaves a default-constructed slot and
 * never affects its siblings.
 *
 * Intended for an executor driven by a single thread; slot writes and the
 * completion count are not synchronised otherwise.
 *
 * @tparam T Result type of each task, default constructible
 * @param tasks Tasks to run
 * @return Results in the order of `tasks`
 */
template<typename T>
[[nodiscard]] auto join_all(std::vector<boost::asio::awaitable<T>> tasks) -> boost::asio::awaitable<std::vector<T>>
{
  struct join_state
  {
    std::vector<T> slots;
    std::size_t remaining;
    boost::asio::steady_timer all_done;
  };

  auto executor = co_await boost::asio::this_coro::executor;
  auto state = std::make_shared<join_state>(join_state{ .slots = std::vector<T>(tasks.size()),
    .remaining = tasks.size(),
    .all_done = boost::asio::steady_timer(executor, boost::asio::steady_timer::time_point::max()) });

  for (std::size_t index = 0; index < tasks.size(); ++index) {
    boost::asio::co_spawn(executor, std::move(tasks[index]), [state, index](std::exception_ptr error, T value) {
      if (error) {
        try {
          std::rethrow_exception(error);
        } catch (const std::exception &e) {
          spdlog::error("[join_all] Task {} failed: {}", index, e.what());
        }
      } else {
        state->slots[index] = std::move(value);
      }

      if (--state->remaining == 0) { state->all_done.cancel(); }
    });
  }

  if (state->remaining > 0) {
    boost::system::error_code wait_error;
    co_await state->all_done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));
  }

  co_return std::move(state->slots);
}

}// namespace relay_probe::async
