#include <relay_probe/platform/time_utils.hpp>

#include <ctime>
#include <fmt/format.h>
#include <tuple>

namespace relay_probe::platform {

auto format_time_hms(const std::uint64_t unix_millis) -> std::string
{
  static constexpr std::uint64_t millis_per_second = 1000;

  const auto time_now = static_cast<std::time_t>(unix_millis / millis_per_second);

  std::tm time_tm{};
#if defined(_WIN32)
  std::ignore = localtime_s(&time_tm, &time_now);
#else
  std::ignore = localtime_r(&time_now, &time_tm);
#endif

  return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}",
    time_tm.tm_hour,
    time_tm.tm_min,
    time_tm.tm_sec,
    static_cast<int>(unix_millis % millis_per_second));
}

auto unix_time_millis() -> std::uint64_t
{
  using namespace std::chrono;
  return static_cast<std::uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

}// namespace relay_probe::platform
