#pragma once

#include "gqlexec/util/id.hpp"

#include <chrono>

namespace gqlexec {

class RequestExecutor;
struct RequestContext;

// Receives executor lifecycle and request notifications for logging and
// metrics. Notifications are synchronous; an exception thrown here is logged
// by the caller and never aborts a build or an eviction.
class IDiagnosticEvents {
public:
  virtual ~IDiagnosticEvents() = default;

  virtual auto executor_created(const ExecutorName & /*name*/,
                                const RequestExecutor & /*executor*/) -> void {}
  virtual auto executor_evicted(const ExecutorName & /*name*/,
                                const RequestExecutor & /*executor*/) -> void {}
  virtual auto request_started(const RequestContext & /*context*/) -> void {}
  virtual auto request_finished(const RequestContext & /*context*/,
                                std::chrono::nanoseconds /*elapsed*/) -> void {}
};

class LoggingDiagnosticEvents final : public IDiagnosticEvents {
public:
  auto executor_created(const ExecutorName &name,
                        const RequestExecutor &executor) -> void override;
  auto executor_evicted(const ExecutorName &name,
                        const RequestExecutor &executor) -> void override;
  auto request_started(const RequestContext &context) -> void override;
  auto request_finished(const RequestContext &context,
                        std::chrono::nanoseconds elapsed) -> void override;
};

} // namespace gqlexec
