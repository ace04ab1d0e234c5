#pragma once

#include "gqlexec/core/error.hpp"
#include "gqlexec/schema/schema.hpp"
#include "gqlexec/schema/type_interceptor.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gqlexec {

class ServiceProvider;

// Value-semantic schema builder. Copies share interceptor instances but not
// the definition, so a builder stored in factory options can be reused as
// the starting point of every build.
class SchemaBuilder {
public:
  SchemaBuilder() = default;

  auto set_name(std::string name) -> SchemaBuilder &;
  auto set_description(std::string description) -> SchemaBuilder &;
  auto set_query_type(std::string type_name) -> SchemaBuilder &;
  auto set_mutation_type(std::string type_name) -> SchemaBuilder &;
  auto set_subscription_type(std::string type_name) -> SchemaBuilder &;
  auto add_type(TypeDefinition type) -> SchemaBuilder &;
  auto set_context_data(std::string key, std::string value) -> SchemaBuilder &;
  auto add_type_interceptor(std::shared_ptr<TypeInterceptor> interceptor)
      -> SchemaBuilder &;
  auto add_services(std::shared_ptr<const ServiceProvider> services)
      -> SchemaBuilder &;

  [[nodiscard]] auto definition() const noexcept -> const SchemaDefinition & {
    return definition_;
  }

  /// Runs the name completion phases and compiles the schema. Fails with
  /// Error::InvalidArgument when no query type is set and Error::AlreadyExists
  /// on duplicate type names.
  [[nodiscard]] auto create() const -> Result<std::shared_ptr<const Schema>>;

private:
  SchemaDefinition definition_;
  std::vector<std::shared_ptr<TypeInterceptor>> interceptors_;
  std::shared_ptr<const ServiceProvider> services_;
};

} // namespace gqlexec
