#pragma once

#include <functional>
#include <memory>
#include <mutex>

namespace relay_probe::monitor {

/**
 * @brief Shared state between a running monitor and the handles controlling it.
 *
 * Every callback a monitor delivers goes through deliver(), which holds the
 * same lock as cancel(). Once cancel() has returned no further callback runs.
 * The mutex is recursive so a callback may cancel its own monitor.
 */
class monitor_control
{
public:
  explicit monitor_control(std::function<void()> stop);

  /// Marks the monitor cancelled and schedules its teardown. Idempotent.
  auto cancel() -> void;

  /// Runs `callback` unless the monitor has been cancelled.
  auto deliver(const std::function<void()> &callback) -> void;

  [[nodiscard]] auto cancelled() const -> bool;

  auto mark_finished() -> void;
  [[nodiscard]] auto finished() const -> bool;

private:
  mutable std::recursive_mutex mutex_;
  std::function<void()> stop_;
  bool cancelled_{ false };
  bool finished_{ false };
};

/**
 * @brief Caller-side handle of a running relay monitor.
 *
 * Copies refer to the same monitor. A default-constructed handle controls nothing.
 */
class monitor_handle
{
public:
  monitor_handle() = default;
  explicit monitor_handle(std::shared_ptr<monitor_control> control);

  /**
   * @brief Force-closes the monitored session and stops polling.
   *
   * Safe to call from any thread and more than once. No log or status callback
   * is delivered after this returns.
   */
  auto cancel() const -> void;

  /// True once the monitor coroutine has exited, for any reason.
  [[nodiscard]] auto finished() const -> bool;

private:
  std::shared_ptr<monitor_control> control_;
};

}// namespace relay_probe::monitor
