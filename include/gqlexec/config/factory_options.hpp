#pragma once

#include "gqlexec/config/configure_action.hpp"
#include "gqlexec/config/executor_options.hpp"
#include "gqlexec/execution/execution_error.hpp"
#include "gqlexec/execution/middleware.hpp"
#include "gqlexec/schema/schema_builder.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace gqlexec {

class Schema;

// Everything needed to build the executor for one name. Sources hand out
// copies, so a build never observes a concurrent reconfiguration.
struct FactoryOptions {
  std::shared_ptr<const Schema> schema;
  std::optional<SchemaBuilder> schema_builder;
  ConfigureActions<SchemaBuilder> schema_builder_actions;

  std::optional<ExecutorOptions> executor_options;
  ConfigureActions<ExecutorOptions> executor_options_actions;

  RequestPipeline pipeline;
  std::vector<ErrorFilterFactory> error_filters;
};

} // namespace gqlexec
