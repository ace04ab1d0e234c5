#include "gqlexec/schema/schema_builder.hpp"

#include "gqlexec/service/service_provider.hpp"
#include "gqlexec/util/id.hpp"
#include "gqlexec/util/log.hpp"

#include <ankerl/unordered_dense.h>

#include <string_view>
#include <utility>

namespace gqlexec {

auto SchemaBuilder::set_name(std::string name) -> SchemaBuilder & {
  definition_.name = std::move(name);
  return *this;
}

auto SchemaBuilder::set_description(std::string description) -> SchemaBuilder & {
  definition_.description = std::move(description);
  return *this;
}

auto SchemaBuilder::set_query_type(std::string type_name) -> SchemaBuilder & {
  definition_.query_type = std::move(type_name);
  return *this;
}

auto SchemaBuilder::set_mutation_type(std::string type_name)
    -> SchemaBuilder & {
  definition_.mutation_type = std::move(type_name);
  return *this;
}

auto SchemaBuilder::set_subscription_type(std::string type_name)
    -> SchemaBuilder & {
  definition_.subscription_type = std::move(type_name);
  return *this;
}

auto SchemaBuilder::add_type(TypeDefinition type) -> SchemaBuilder & {
  definition_.types.push_back(std::move(type));
  return *this;
}

auto SchemaBuilder::set_context_data(std::string key, std::string value)
    -> SchemaBuilder & {
  definition_.context_data.insert_or_assign(std::move(key), std::move(value));
  return *this;
}

auto SchemaBuilder::add_type_interceptor(
    std::shared_ptr<TypeInterceptor> interceptor) -> SchemaBuilder & {
  if (interceptor) {
    interceptors_.push_back(std::move(interceptor));
  }
  return *this;
}

auto SchemaBuilder::add_services(
    std::shared_ptr<const ServiceProvider> services) -> SchemaBuilder & {
  services_ = std::move(services);
  return *this;
}

auto SchemaBuilder::create() const -> Result<std::shared_ptr<const Schema>> {
  SchemaDefinition definition = definition_;

  for (const auto &interceptor : interceptors_) {
    if (interceptor->can_handle_schema()) {
      interceptor->on_before_complete_name(definition);
    }
  }
  if (definition.name.empty()) {
    definition.name = std::string(kDefaultExecutorName);
  }
  for (const auto &interceptor : interceptors_) {
    if (interceptor->can_handle_schema()) {
      interceptor->on_after_complete_name(definition);
    }
  }

  if (definition.query_type.empty()) {
    log::warn("Schema '{}' has no query type", definition.name);
    return fail(Error::InvalidArgument);
  }

  ankerl::unordered_dense::set<std::string_view> seen;
  for (const auto &type : definition.types) {
    if (!seen.insert(type.name).second) {
      log::warn("Schema '{}' declares type '{}' more than once",
                definition.name, type.name);
      return fail(Error::AlreadyExists);
    }
  }

  return ok(std::make_shared<const Schema>(std::move(definition), services_));
}

} // namespace gqlexec
