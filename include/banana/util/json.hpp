#pragma once

#include "banana/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace banana {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

inline constexpr auto kLenientJson =
    glz::opts{.null_terminated = false, .error_on_unknown_keys = false};

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

/// Decode `input` into a glaze-described struct, ignoring unknown keys.
template <typename T>
[[nodiscard]] auto read_json_as(std::string_view input) -> Result<T> {
  T value{};
  if (auto ec = glz::read<kLenientJson>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

template <typename T>
[[nodiscard]] auto write_json_of(const T &value) -> Result<std::string> {
  auto out = glz::write_json(value);
  if (!out) {
    return fail(Error::ParseError);
  }
  return ok(std::move(*out));
}

} // namespace banana
