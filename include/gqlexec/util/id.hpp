#pragma once

#include <algorithm>
#include <cctype>
#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace gqlexec {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() && !has_control_chars(value);
}

struct ExecutorTag {};

// Type-safe string identifier; the tag keeps unrelated names apart at compile
// time.
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

/// Cache key of a compiled executor. Equal names compare equal by value.
using ExecutorName = TypedId<ExecutorTag>;

inline constexpr std::string_view kDefaultExecutorName = "_Default";

[[nodiscard]] inline auto default_executor_name() -> ExecutorName {
  return ExecutorName{kDefaultExecutorName};
}

/// Empty names resolve to the default executor.
[[nodiscard]] inline auto resolve_name(ExecutorName name) -> ExecutorName {
  return name.empty() ? default_executor_name() : std::move(name);
}

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace gqlexec

// `is_avalanching` lets ankerl::unordered_dense use this hash directly rather
// than rehashing the object bytes.
template <typename Tag> struct std::hash<gqlexec::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const gqlexec::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<gqlexec::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const gqlexec::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
