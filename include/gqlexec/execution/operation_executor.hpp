#pragma once

#include "gqlexec/core/coroutine.hpp"
#include "gqlexec/core/error.hpp"

#include <string>

namespace gqlexec {

struct RequestContext;

// Parses, validates and executes the operation of a request. Registered in
// the service provider; the pipeline's execution stage delegates to it.
class IOperationExecutor {
public:
  virtual ~IOperationExecutor() = default;
  virtual auto execute(RequestContext &context) -> task<Result<std::string>> = 0;
};

} // namespace gqlexec
