#include <relay_probe/platform/env_utils.hpp>

#include <cstdlib>
#include <mutex>

namespace relay_probe::platform {

namespace {
#ifdef _WIN32
  constexpr const char *home_variable = "USERPROFILE";
#else
  constexpr const char *home_variable = "HOME";
#endif

  auto home_directory() -> std::string
  {
    static std::mutex env_mutex;
    const std::scoped_lock lock(env_mutex);

    const char *home = std::getenv(home_variable);// NOLINT(concurrency-mt-unsafe)
    return home != nullptr ? std::string(home) : "";
  }
}// namespace

auto expand_tilde_path(const std::string &path) -> std::string
{
  if (not path.starts_with("~/")) { return path; }

  auto home = home_directory();
  if (home.empty()) { return path; }

  return home + path.substr(1);
}

}// namespace relay_probe::platform
