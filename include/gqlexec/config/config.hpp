#pragma once

#include "gqlexec/config/executor_options.hpp"
#include "gqlexec/core/error.hpp"
#include "gqlexec/util/id.hpp"
#include "gqlexec/util/log.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace gqlexec {

struct LoggingConfig {
  log::Level level{log::Level::Info};
  std::string file;
};

struct WatchConfig {
  bool enabled{false};
  std::string directory{"./executors"};
};

// Process-level settings of the resolver host.
struct ResolverConfig {
  LoggingConfig logging{};
  WatchConfig watch{};
};

// Contents of one per-executor file. The name defaults to the file stem.
struct ExecutorSettings {
  ExecutorName name;
  ExecutorOptions options{};
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<ResolverConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<ResolverConfig>;

  [[nodiscard]] static auto
  load_executor_settings(const std::filesystem::path &path)
      -> Result<ExecutorSettings>;
  [[nodiscard]] static auto
  parse_executor_settings(std::string_view toml_str,
                          std::string_view default_name)
      -> Result<ExecutorSettings>;
};

} // namespace gqlexec
