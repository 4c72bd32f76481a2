#include <relay_probe/monitor/monitor_handle.hpp>

#include <utility>

namespace relay_probe::monitor {

monitor_control::monitor_control(std::function<void()> stop) : stop_(std::move(stop)) {}

auto monitor_control::cancel() -> void
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (cancelled_) { return; }
  cancelled_ = true;
  if (stop_) { stop_(); }
}

auto monitor_control::deliver(const std::function<void()> &callback) -> void
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (cancelled_) { return; }
  callback();
}

auto monitor_control::cancelled() const -> bool
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);
  return cancelled_;
}

auto monitor_control::mark_finished() -> void
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);
  finished_ = true;
}

auto monitor_control::finished() const -> bool
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);
  return finished_;
}

monitor_handle::monitor_handle(std::shared_ptr<monitor_control> control) : control_(std::move(control)) {}

auto monitor_handle::cancel() const -> void
{
  if (control_) { control_->cancel(); }
}

auto monitor_handle::finished() const -> bool { return not control_ or control_->finished(); }

}// namespace relay_probe::monitor
