#pragma once

#include "gqlexec/util/enum.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gqlexec {

class ServiceProvider;

enum class TypeKind : std::uint8_t {
  Object,
  Interface,
  Union,
  Enum,
  InputObject,
  Scalar,
};
BOOST_DESCRIBE_ENUM(TypeKind, Object, Interface, Union, Enum, InputObject,
                    Scalar)
GQLEXEC_DEFINE_ENUM_SERDE(TypeKind, TypeKind::Object)

struct TypeDefinition {
  std::string name;
  TypeKind kind{TypeKind::Object};
  std::string description;

  auto operator==(const TypeDefinition &) const -> bool = default;
};

// Mutable description of a schema while it is being built. Interceptors see
// and may rewrite it during the completion phases of SchemaBuilder::create().
struct SchemaDefinition {
  std::string name;
  std::string description;
  std::string query_type{"Query"};
  std::string mutation_type;
  std::string subscription_type;
  std::vector<TypeDefinition> types;
  ankerl::unordered_dense::map<std::string, std::string> context_data;
};

// Immutable, compiled schema. Shared read-only by the executor that owns it.
class Schema {
public:
  Schema(SchemaDefinition definition,
         std::shared_ptr<const ServiceProvider> services);

  Schema(const Schema &) = delete;
  auto operator=(const Schema &) -> Schema & = delete;

  [[nodiscard]] auto name() const noexcept -> std::string_view {
    return definition_.name;
  }
  [[nodiscard]] auto description() const noexcept -> std::string_view {
    return definition_.description;
  }
  [[nodiscard]] auto query_type() const noexcept -> std::string_view {
    return definition_.query_type;
  }
  [[nodiscard]] auto mutation_type() const noexcept -> std::string_view {
    return definition_.mutation_type;
  }
  [[nodiscard]] auto subscription_type() const noexcept -> std::string_view {
    return definition_.subscription_type;
  }
  [[nodiscard]] auto types() const noexcept
      -> const std::vector<TypeDefinition> & {
    return definition_.types;
  }
  [[nodiscard]] auto find_type(std::string_view name) const
      -> const TypeDefinition *;
  [[nodiscard]] auto context_value(std::string_view key) const
      -> std::optional<std::string_view>;
  [[nodiscard]] auto services() const noexcept
      -> const std::shared_ptr<const ServiceProvider> & {
    return services_;
  }

private:
  SchemaDefinition definition_;
  std::shared_ptr<const ServiceProvider> services_;
};

} // namespace gqlexec
