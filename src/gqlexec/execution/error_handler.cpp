#include "gqlexec/execution/error_handler.hpp"

#include "gqlexec/core/error.hpp"

#include <utility>

namespace gqlexec {

namespace {
constexpr std::string_view kUnexpectedErrorMessage = "Unexpected Execution Error";
constexpr std::string_view kUnexpectedErrorCode = "EXEC_UNEXPECTED";
} // namespace

ErrorHandler::ErrorHandler(std::vector<std::shared_ptr<IErrorFilter>> filters,
                           ExecutorOptions options)
    : filters_(std::move(filters)), options_(options) {}

auto ErrorHandler::handle(ExecutionError error) const -> ExecutionError {
  for (const auto &filter : filters_) {
    error = filter->on_error(std::move(error));
  }
  return error;
}

auto ErrorHandler::create_error(std::error_code ec, std::string message) const
    -> ExecutionError {
  ExecutionError error;
  error.message = std::move(message);
  error.code = ec.message();
  error.error = ec;
  return error;
}

auto ErrorHandler::create_unexpected_error(const std::exception &ex) const
    -> ExecutionError {
  ExecutionError error;
  error.message = std::string(kUnexpectedErrorMessage);
  error.code = std::string(kUnexpectedErrorCode);
  error.error = make_error_code(Error::Unknown);
  if (options_.include_exception_details) {
    error.extensions.insert_or_assign("message", ex.what());
  }
  return error;
}

} // namespace gqlexec
