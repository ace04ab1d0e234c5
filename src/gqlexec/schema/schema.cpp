#include "gqlexec/schema/schema.hpp"

#include "gqlexec/service/service_provider.hpp"

#include <algorithm>
#include <utility>

namespace gqlexec {

Schema::Schema(SchemaDefinition definition,
               std::shared_ptr<const ServiceProvider> services)
    : definition_(std::move(definition)), services_(std::move(services)) {}

auto Schema::find_type(std::string_view name) const -> const TypeDefinition * {
  auto it = std::ranges::find(definition_.types, name, &TypeDefinition::name);
  return it != definition_.types.end() ? &*it : nullptr;
}

auto Schema::context_value(std::string_view key) const
    -> std::optional<std::string_view> {
  auto it = definition_.context_data.find(std::string(key));
  if (it == definition_.context_data.end()) {
    return std::nullopt;
  }
  return std::string_view{it->second};
}

} // namespace gqlexec
