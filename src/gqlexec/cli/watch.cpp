#include "gqlexec/cli/commands.hpp"
#include "gqlexec/config/config.hpp"
#include "gqlexec/config/file_options_source.hpp"
#include "gqlexec/config/options_source.hpp"
#include "gqlexec/core/coroutine.hpp"
#include "gqlexec/execution/diagnostic_events.hpp"
#include "gqlexec/execution/executor_registry.hpp"
#include "gqlexec/execution/request_executor.hpp"
#include "gqlexec/service/service_provider.hpp"
#include "gqlexec/util/log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdio>
#include <format>
#include <memory>
#include <string>

namespace gqlexec::cli {

namespace {

auto build(ExecutorRegistry &registry, ExecutorName name) -> task<void> {
  auto executor = co_await registry.get_or_create(name);
  if (!executor) {
    log::error("Executor {} failed to build: {}", name,
               executor.error().message());
    co_return;
  }
  const auto &options = (*executor)->options();
  log::info("Executor {} ready (timeout {}ms, query cache {})", name,
            options.execution_timeout.count(), options.query_cache_size);
}

} // namespace

auto cmd_watch(const WatchOptions &opts) -> int {
  auto config = ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    std::fputs(std::format("Error: {}: {}\n", opts.config_file,
                           config.error().message())
                   .c_str(),
               stderr);
    return 1;
  }
  if (!opts.directory && !config->watch.enabled) {
    std::fputs("Error: [watch] is disabled and no --directory was given\n",
               stderr);
    return 1;
  }

  log::set_output_stderr();
  const auto log_file = opts.log_file.value_or(config->logging.file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::fputs(std::format("Error: cannot open log file {}\n", log_file).c_str(),
               stderr);
    return 1;
  }
  if (opts.log_level) {
    log::set_level(*opts.log_level);
  } else {
    log::set_level(config->logging.level);
  }
  log::start();

  boost::asio::io_context io;
  auto store = std::make_shared<FactoryOptionsStore>();
  auto diagnostics = std::make_shared<LoggingDiagnosticEvents>();
  ExecutorRegistry registry(io.get_executor(), store,
                            std::make_shared<const ServiceProvider>(),
                            diagnostics);
  FileOptionsSource source(io.get_executor(),
                           opts.directory.value_or(config->watch.directory),
                           store);

  // Rebuild evicted executors right away.
  registry.subscribe(ExecutorEvent::Evicted,
                     [&io, &registry](const ExecutorName &name,
                                      const ExecutorPtr &) {
                       co_spawn(io, build(registry, name), detached);
                     });

  if (auto started = source.start(); !started) {
    log::error("Cannot watch {}: {}", source.directory().string(),
               started.error().message());
    log::stop();
    return 1;
  }
  for (const auto &name : source.names()) {
    co_spawn(io, build(registry, name), detached);
  }

  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int signo) {
    if (ec) {
      return;
    }
    log::info("Received signal {}, shutting down", signo);
    source.stop();
    registry.dispose();
    io.stop();
  });

  log::info("Watching {} for executor configuration changes",
            source.directory().string());
  io.run();

  log::stop();
  return 0;
}

} // namespace gqlexec::cli
