#pragma once

#include "gqlexec/config/factory_options.hpp"
#include "gqlexec/core/coroutine.hpp"
#include "gqlexec/core/error.hpp"
#include "gqlexec/util/id.hpp"

#include <memory>

namespace gqlexec {

class Schema;
class ServiceProvider;

/// Returns the schema for `name`: the pre-built schema from `options` when
/// present, otherwise one built from the configured builder and actions with
/// its name bound to `name`. Fails with Error::SchemaNameMismatch when the
/// resulting schema is named differently.
[[nodiscard]] auto resolve_schema(const ExecutorName &name,
                                  const FactoryOptions &options,
                                  std::shared_ptr<const ServiceProvider> services)
    -> task<Result<std::shared_ptr<const Schema>>>;

} // namespace gqlexec
