#include "gqlexec/cli/commands.hpp"
#include "gqlexec/config/config.hpp"
#include "gqlexec/config/file_options_source.hpp"
#include "gqlexec/util/log.hpp"

#include <glaze/json.hpp>

#include <cstdio>
#include <format>
#include <string>
#include <vector>

namespace gqlexec::cli {

namespace {

struct ValidationResult {
  std::string file;
  std::string executor;
  bool valid{false};
  std::string error;
};

auto print_line(std::FILE *out, const std::string &line) -> void {
  std::fputs(line.c_str(), out);
  std::fputc('\n', out);
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();

  auto config = ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    print_line(stderr, std::format("Error: {}: {}", opts.config_file,
                                   config.error().message()));
    return 1;
  }
  const std::string directory = opts.directory.value_or(config->watch.directory);

  auto files = FileOptionsSource::scan_directory(directory);
  if (!files) {
    print_line(stderr, std::format("Error: cannot read {}: {}", directory,
                                   files.error().message()));
    return 1;
  }

  std::vector<ValidationResult> results;
  ankerl::unordered_dense::map<ExecutorName, std::string> seen;
  for (const auto &file : *files) {
    ValidationResult vr{.file = file.path.string()};
    if (!file.settings) {
      vr.error = file.settings.error().message();
    } else {
      vr.executor = file.settings->name.str();
      auto [it, inserted] = seen.try_emplace(file.settings->name, vr.file);
      if (!inserted) {
        vr.error = std::format("executor '{}' is already defined in {}",
                               vr.executor, it->second);
      } else {
        vr.valid = true;
      }
    }
    results.push_back(std::move(vr));
  }

  std::size_t invalid = 0;
  for (const auto &vr : results) {
    invalid += vr.valid ? 0 : 1;
  }

  if (opts.json) {
    std::string out;
    if (auto ec = glz::write_json(results, out); ec) {
      print_line(stderr, "Error: failed to encode results");
      return 1;
    }
    print_line(stdout, out);
  } else {
    for (const auto &vr : results) {
      if (vr.valid) {
        print_line(stdout, std::format("  OK    {} ({})", vr.file, vr.executor));
      } else {
        print_line(stdout, std::format("  FAIL  {}: {}", vr.file, vr.error));
      }
    }
    print_line(stdout, std::format("{} file(s), {} invalid", results.size(),
                                   invalid));
  }
  return invalid == 0 ? 0 : 1;
}

} // namespace gqlexec::cli
