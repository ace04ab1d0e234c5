#pragma once

#include <optional>
#include <string>

namespace gqlexec::cli {

struct ValidateOptions {
  std::string config_file;
  std::optional<std::string> directory;
  bool json{false};
};

struct WatchOptions {
  std::string config_file;
  std::optional<std::string> directory;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
};

auto cmd_validate(const ValidateOptions &opts) -> int;
auto cmd_watch(const WatchOptions &opts) -> int;

} // namespace gqlexec::cli
