#pragma once

#include "gqlexec/config/executor_options.hpp"
#include "gqlexec/core/coroutine.hpp"
#include "gqlexec/execution/middleware.hpp"
#include "gqlexec/execution/request_context.hpp"
#include "gqlexec/util/id.hpp"

#include <memory>

namespace gqlexec {

class Activator;
class ErrorHandler;
class IDiagnosticEvents;
class Schema;
class ServiceProvider;

struct RequestExecutorParts {
  ExecutorName name;
  std::shared_ptr<const Schema> schema;
  std::shared_ptr<const ExecutorOptions> options;
  std::shared_ptr<const ErrorHandler> error_handler;
  std::shared_ptr<const Activator> activator;
  std::shared_ptr<const ServiceProvider> services;
  std::shared_ptr<IDiagnosticEvents> diagnostics;
  RequestDelegate pipeline;
};

// A compiled, ready-to-serve executor. Never mutated after construction, so
// one instance is shared by all callers; requests in flight keep it alive
// after it has been evicted from the registry.
class RequestExecutor
    : public std::enable_shared_from_this<RequestExecutor> {
public:
  explicit RequestExecutor(RequestExecutorParts parts);

  RequestExecutor(const RequestExecutor &) = delete;
  auto operator=(const RequestExecutor &) -> RequestExecutor & = delete;

  [[nodiscard]] auto execute(Request request) const -> task<Response>;

  [[nodiscard]] auto name() const noexcept -> const ExecutorName & {
    return parts_.name;
  }
  [[nodiscard]] auto schema() const noexcept -> const Schema & {
    return *parts_.schema;
  }
  [[nodiscard]] auto options() const noexcept -> const ExecutorOptions & {
    return *parts_.options;
  }
  [[nodiscard]] auto error_handler() const noexcept -> const ErrorHandler & {
    return *parts_.error_handler;
  }
  [[nodiscard]] auto services() const noexcept
      -> const std::shared_ptr<const ServiceProvider> & {
    return parts_.services;
  }

private:
  RequestExecutorParts parts_;
};

} // namespace gqlexec
