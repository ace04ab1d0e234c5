#pragma once

#include "gqlexec/config/executor_options.hpp"
#include "gqlexec/config/factory_options.hpp"
#include "gqlexec/execution/execution_error.hpp"

#include <memory>
#include <vector>

namespace gqlexec {

class ServiceProvider;

/// Filters from `options.error_filters` (one per factory, in order) followed
/// by every IErrorFilter registered in `services`.
[[nodiscard]] auto collect_error_filters(const FactoryOptions &options,
                                         const ExecutorOptions &executor_options,
                                         const ServiceProvider &services)
    -> std::vector<std::shared_ptr<IErrorFilter>>;

} // namespace gqlexec
