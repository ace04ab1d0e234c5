#pragma once

#include "gqlexec/execution/middleware.hpp"
#include "gqlexec/util/id.hpp"

#include <memory>

namespace gqlexec {

/// Folds `middleware` right to left into one delegate around a terminal that
/// does nothing. Calling the result runs the middleware in list order. An
/// empty list is replaced by default_pipeline().
[[nodiscard]] auto
compose_pipeline(const ExecutorName &name, const RequestPipeline &middleware,
                 std::shared_ptr<const ServiceProvider> services,
                 std::shared_ptr<const Activator> activator,
                 std::shared_ptr<const ErrorHandler> error_handler,
                 std::shared_ptr<const ExecutorOptions> options,
                 std::shared_ptr<IDiagnosticEvents> diagnostics = nullptr)
    -> RequestDelegate;

} // namespace gqlexec
