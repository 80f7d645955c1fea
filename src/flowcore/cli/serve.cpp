#include "flowcore/app/application.hpp"
#include "flowcore/cli/commands.hpp"
#include "flowcore/config/config.hpp"
#include "flowcore/util/log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <print>
#include <unistd.h>

namespace flowcore::cli {

namespace {

// Blocks the calling thread until SIGINT or SIGTERM arrives.
auto wait_for_shutdown() -> int {
  boost::asio::io_context io;
  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  int received = 0;
  signals.async_wait(
      [&received](const boost::system::error_code &ec, int signo) {
        if (!ec) {
          received = signo;
        }
      });
  io.run();
  return received;
}

} // namespace

auto cmd_serve(const ServeOptions &opts) -> int {
  SystemConfig config;
  if (opts.config_file) {
    auto loaded = ConfigLoader::load_from_file(*opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: {}: {}", *opts.config_file,
                   loaded.error().message());
      return 1;
    }
    config = std::move(*loaded);
  }
  if (opts.log_level) {
    config.logging.level = *opts.log_level;
  }
  if (opts.shards) {
    config.runtime.shards = *opts.shards;
  }

  Application app(std::move(config));
  app.set_definitions_dir(opts.definitions_dir);
  if (auto r = app.start(LaunchOptions{.watch_definitions = true,
                                       .triggers = !opts.no_triggers});
      !r) {
    std::println(stderr, "Error: failed to start: {}", r.error().message());
    return 1;
  }
  log::info("Serving definitions from {} (pid {})", opts.definitions_dir,
            ::getpid());

  const int signo = wait_for_shutdown();
  log::info("Received signal {}, shutting down", signo);
  app.stop();
  return 0;
}

} // namespace flowcore::cli
