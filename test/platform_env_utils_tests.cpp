#include <relay_probe/platform/env_utils.hpp>

#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <string>

TEST_CASE("expand_tilde_path leaves paths without a leading ~/ alone", "[platform][env]")
{
  using relay_probe::platform::expand_tilde_path;

  CHECK(expand_tilde_path("/etc/relay-probe.json") == "/etc/relay-probe.json");
  CHECK(expand_tilde_path("config.json") == "config.json");
  CHECK(expand_tilde_path("~other/config.json") == "~other/config.json");
  CHECK(expand_tilde_path("") == "");
}

TEST_CASE("expand_tilde_path substitutes the home directory", "[platform][env]")
{
#ifdef _WIN32
  const char *home = std::getenv("USERPROFILE");// NOLINT(concurrency-mt-unsafe)
#else
  const char *home = std::getenv("HOME");// NOLINT(concurrency-mt-unsafe)
#endif
  if (home == nullptr or std::string(home).empty()) { SKIP("no home directory in the environment"); }

  CHECK(relay_probe::platform::expand_tilde_path("~/.relay-probe/config.json")
        == std::string(home) + "/.relay-probe/config.json");
}
