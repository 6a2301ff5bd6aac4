#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace banana {

struct JobTag {};

// Phantom-typed string id. Keeps job ids from mixing with arbitrary strings
// (prompts, paths) at call sites.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto clone() const -> TypedId { return TypedId{value_}; }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

private:
  std::string value_;
};

using JobId = TypedId<JobTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

inline constexpr std::string_view kJobIdPrefix = "bn_";
inline constexpr std::size_t kJobIdSuffixLength = 8;

namespace detail {
[[nodiscard]] auto generate_short_uuid() -> std::string;
} // namespace detail

/// `bn_` followed by 8 random lowercase hex digits.
[[nodiscard]] auto generate_job_id() -> JobId;

/// Shape check only; does not consult the store.
[[nodiscard]] auto is_valid_job_id(std::string_view text) noexcept -> bool;

/// Id prefix as typed by a user: "3f9a" becomes "bn_3f9a". Input that
/// already starts with (or is part of) "bn_" is returned unchanged.
[[nodiscard]] auto expand_job_id_prefix(std::string_view input) -> std::string;

} // namespace banana

template <typename Tag> struct std::hash<banana::TypedId<Tag>> {
  auto operator()(const banana::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<banana::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const banana::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
