#pragma once

#include "gqlexec/core/coroutine.hpp"
#include "gqlexec/util/id.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace gqlexec {

class Activator;
class ErrorHandler;
class IDiagnosticEvents;
class ServiceProvider;
struct ExecutorOptions;
struct RequestContext;

using RequestDelegate = std::function<task<void>(RequestContext &)>;

// Shared by every middleware factory of one executor build.
struct MiddlewareFactoryContext {
  ExecutorName executor_name;
  std::shared_ptr<const ServiceProvider> services;
  std::shared_ptr<const Activator> activator;
  std::shared_ptr<const ErrorHandler> error_handler;
  std::shared_ptr<const ExecutorOptions> options;
  std::shared_ptr<IDiagnosticEvents> diagnostics;
};

/// Wraps `next` into a new delegate. Code before `co_await next(ctx)` runs on
/// the way in, code after it on the way out.
using RequestMiddleware =
    std::function<RequestDelegate(const MiddlewareFactoryContext &,
                                  RequestDelegate next)>;

using RequestPipeline = std::vector<RequestMiddleware>;

} // namespace gqlexec
