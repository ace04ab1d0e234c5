#pragma once

#include <ankerl/unordered_dense.h>

#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace gqlexec {

class ServiceProvider;
struct ExecutorOptions;

// Error reported to the client as part of a response.
struct ExecutionError {
  std::string message;
  std::string code;
  std::vector<std::string> path;
  ankerl::unordered_dense::map<std::string, std::string> extensions;
  std::error_code error;
};

// Rewrites errors before they reach the response. Filters are shared by all
// requests of an executor and must be safe to call concurrently.
class IErrorFilter {
public:
  virtual ~IErrorFilter() = default;
  virtual auto on_error(ExecutionError error) -> ExecutionError = 0;
};

using ErrorFilterFactory = std::function<std::shared_ptr<IErrorFilter>(
    const ServiceProvider &, const ExecutorOptions &)>;

} // namespace gqlexec
