#include "gqlexec/cli/commands.hpp"
#include "gqlexec/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("GQLEXEC_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  gqlexec::log::set_output_stderr();
  gqlexec::log::set_level(gqlexec::log::Level::Warn);

  CLI::App app{"gqlexec", "Named GraphQL request executor resolver"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  gqlexec validate -c resolver.toml\n"
             "  gqlexec watch -c resolver.toml --log-level debug\n"
             "\nTip: Set GQLEXEC_CONFIG=resolver.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  gqlexec::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand(
      "validate", "Check the resolver config and every executor file");
  validate_opts.config_file = env_config;
  auto *validate_cfg =
      validate
          ->add_option("-c,--config", validate_opts.config_file,
                       "Resolver config file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    validate_cfg->required();
  validate->add_option("-d,--directory", validate_opts.directory,
                       "Executor directory (overrides [watch] directory)");
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(gqlexec::cli::cmd_validate(validate_opts));
  });

  gqlexec::cli::WatchOptions watch_opts;
  auto *watch = app.add_subcommand(
      "watch", "Build configured executors and rebuild them on change");
  watch_opts.config_file = env_config;
  auto *watch_cfg = watch
                        ->add_option("-c,--config", watch_opts.config_file,
                                     "Resolver config file")
                        ->check(CLI::ExistingFile);
  if (env_config.empty())
    watch_cfg->required();
  watch->add_option("-d,--directory", watch_opts.directory,
                    "Executor directory (overrides [watch] directory)");
  watch->add_option("--log-file", watch_opts.log_file, "Log file path");
  watch->add_option("--log-level", watch_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  watch->callback(
      [&watch_opts]() { std::exit(gqlexec::cli::cmd_watch(watch_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
