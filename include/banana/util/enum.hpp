#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace banana {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

namespace util {

[[nodiscard]] inline auto enum_name_to_snake_case(std::string_view name)
    -> std::string {
  std::string out;
  out.reserve(name.size() + 4);
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto ch = static_cast<unsigned char>(name[i]);
    if (std::isupper(ch) != 0 && i > 0) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(ch)));
  }
  return out;
}

template <typename E>
[[nodiscard]] inline auto
enum_to_snake_case_view(E value, std::string_view fallback = "unknown") noexcept
    -> std::string_view {
  using descriptors = boost::describe::describe_enumerators<E>;
  constexpr std::size_t kCount = boost::mp11::mp_size<descriptors>::value;

  static const auto table = [] {
    std::array<std::pair<E, std::string>, kCount> out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<descriptors>([&](auto descriptor) {
      out[i++] = {descriptor.value, enum_name_to_snake_case(descriptor.name)};
    });
    return out;
  }();

  for (const auto &[enum_value, text] : table) {
    if (enum_value == value) {
      return text;
    }
  }
  return fallback;
}

/// Strict lookup by snake_case name ("transient_exhausted") or the
/// declared name ("TransientExhausted").
template <typename E>
[[nodiscard]] inline auto try_parse_enum(std::string_view input) noexcept
    -> std::optional<E> {
  std::optional<E> out;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) {
        if (input == descriptor.name ||
            input == enum_to_snake_case_view(descriptor.value)) {
          out = descriptor.value;
        }
      });
  return out;
}

template <typename E>
[[nodiscard]] inline auto parse_enum(std::string_view input,
                                     E default_value) noexcept -> E {
  return try_parse_enum<E>(input).value_or(default_value);
}

} // namespace util

#define BANANA_DEFINE_ENUM_SERDE(EnumType, DefaultValue)                       \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::banana::util::enum_to_snake_case_view(value);                     \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> EnumType {                                                            \
    return ::banana::util::parse_enum(s, DefaultValue);                        \
  }

} // namespace banana
