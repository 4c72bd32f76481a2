#include <relay_probe/cli_utils/app_init.hpp>
#include <relay_probe/cli_utils/cli_parser.hpp>
#include <relay_probe/cli_utils/command_runner.hpp>
#include <relay_probe/nostr/relay_info_client.hpp>
#include <relay_probe/session/connection_session.hpp>
#include <relay_probe/transport/websocket_stream.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fmt/core.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  using runner_t =
    relay_probe::cli_utils::command_runner<relay_probe::transport::websocket_stream, relay_probe::nostr::relay_info_client>;

  auto args = relay_probe::cli_utils::parse_cli_args(argc, argv);

  if (args.show_version) {
    relay_probe::cli_utils::print_version();
    return EXIT_SUCCESS;
  }

  if (not relay_probe::cli_utils::validate_cli_args(args)) { return EXIT_FAILURE; }

  relay_probe::core::probe_config config;
  try {
    config = relay_probe::cli_utils::load_config(args);
  } catch (const std::invalid_argument &e) {
    spdlog::error("Invalid configuration {}: {}", args.config_path, e.what());
    return EXIT_FAILURE;
  }

  relay_probe::cli_utils::configure_logging(args, config);

  auto io_context = std::make_shared<boost::asio::io_context>();
  relay_probe::nostr::relay_info_client info_client(config.metadata_timeout);

  auto runner = std::make_shared<runner_t>(io_context->get_executor(),
    relay_probe::session::make_websocket_factory(io_context),
    info_client,
    config,
    [](const std::string &text) { fmt::print("{}", text); });

  boost::asio::signal_set signals(*io_context, SIGINT, SIGTERM);
  signals.async_wait([runner](const boost::system::error_code &error, int /*signal_number*/) {
    if (not error) { runner->request_stop(); }
  });

  int exit_code = EXIT_FAILURE;
  boost::asio::co_spawn(*io_context, runner->execute(args), [&exit_code, &signals](std::exception_ptr error, int code) {
    boost::system::error_code ignored;
    signals.cancel(ignored);

    if (not error) {
      exit_code = code;
      return;
    }
    try {
      std::rethrow_exception(error);
    } catch (const std::exception &e) {
      spdlog::error("{}", e.what());
      exit_code = EXIT_FAILURE;
    }
  });

  io_context->run();

  return exit_code;
}
