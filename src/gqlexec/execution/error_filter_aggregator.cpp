#include "gqlexec/execution/error_filter_aggregator.hpp"

#include "gqlexec/service/service_provider.hpp"

namespace gqlexec {

auto collect_error_filters(const FactoryOptions &options,
                           const ExecutorOptions &executor_options,
                           const ServiceProvider &services)
    -> std::vector<std::shared_ptr<IErrorFilter>> {
  auto registered = services.get_services<IErrorFilter>();

  std::vector<std::shared_ptr<IErrorFilter>> filters;
  filters.reserve(options.error_filters.size() + registered.size());
  for (const auto &factory : options.error_filters) {
    if (auto filter = factory(services, executor_options)) {
      filters.push_back(std::move(filter));
    }
  }
  for (auto &filter : registered) {
    filters.push_back(std::move(filter));
  }
  return filters;
}

} // namespace gqlexec
