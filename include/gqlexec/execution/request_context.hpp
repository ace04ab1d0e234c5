#pragma once

#include "gqlexec/execution/error_handler.hpp"
#include "gqlexec/execution/execution_error.hpp"
#include "gqlexec/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace gqlexec {

class Schema;
class ServiceProvider;

struct Request {
  std::string query;
  std::string operation_name;
  ankerl::unordered_dense::map<std::string, std::string> variables;
};

struct Response {
  std::optional<std::string> data;
  std::vector<ExecutionError> errors;

  [[nodiscard]] auto has_errors() const noexcept -> bool {
    return !errors.empty();
  }
};

// State of one request as it moves through the pipeline.
struct RequestContext {
  ExecutorName executor_name;
  std::shared_ptr<const Schema> schema;
  std::shared_ptr<const ServiceProvider> services;
  std::shared_ptr<const ErrorHandler> error_handler;
  Request request;
  std::optional<std::string> result;
  std::vector<ExecutionError> errors;
  ankerl::unordered_dense::map<std::string, std::string> items;

  auto add_error(ExecutionError error) -> void {
    errors.push_back(error_handler ? error_handler->handle(std::move(error))
                                   : std::move(error));
  }

  auto add_error(std::error_code ec, std::string message) -> void {
    if (error_handler) {
      add_error(error_handler->create_error(ec, std::move(message)));
      return;
    }
    add_error(ExecutionError{.message = std::move(message),
                             .code = ec.message(),
                             .error = ec});
  }

  [[nodiscard]] auto has_errors() const noexcept -> bool {
    return !errors.empty();
  }
};

} // namespace gqlexec
