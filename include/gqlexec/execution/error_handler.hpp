#pragma once

#include "gqlexec/config/executor_options.hpp"
#include "gqlexec/execution/execution_error.hpp"

#include <exception>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace gqlexec {

class ErrorHandler {
public:
  ErrorHandler(std::vector<std::shared_ptr<IErrorFilter>> filters,
               ExecutorOptions options);

  /// Passes `error` through every filter in order.
  [[nodiscard]] auto handle(ExecutionError error) const -> ExecutionError;

  [[nodiscard]] auto create_error(std::error_code ec, std::string message) const
      -> ExecutionError;

  /// Message is generic unless exception details are enabled.
  [[nodiscard]] auto create_unexpected_error(const std::exception &ex) const
      -> ExecutionError;

  [[nodiscard]] auto filters() const noexcept
      -> const std::vector<std::shared_ptr<IErrorFilter>> & {
    return filters_;
  }

private:
  std::vector<std::shared_ptr<IErrorFilter>> filters_;
  ExecutorOptions options_;
};

} // namespace gqlexec
