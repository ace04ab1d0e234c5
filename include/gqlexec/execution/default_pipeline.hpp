#pragma once

#include "gqlexec/execution/middleware.hpp"

namespace gqlexec {

/// Reports request start and completion to the diagnostics sink.
[[nodiscard]] auto use_instrumentation() -> RequestMiddleware;

/// Turns exceptions escaping the rest of the chain into response errors.
[[nodiscard]] auto use_exception_handling() -> RequestMiddleware;

/// Bounds the rest of the chain by ExecutorOptions::execution_timeout.
[[nodiscard]] auto use_request_timeout() -> RequestMiddleware;

/// Rejects requests without a query document.
[[nodiscard]] auto use_request_validation() -> RequestMiddleware;

/// Hands the request to the registered IOperationExecutor.
[[nodiscard]] auto use_operation_execution() -> RequestMiddleware;

/// The pipeline used when an executor configures none: instrumentation,
/// exception handling, request timeout, request validation, operation
/// execution.
[[nodiscard]] auto default_pipeline() -> RequestPipeline;

} // namespace gqlexec
