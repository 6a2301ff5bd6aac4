#pragma once

#include "banana/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <tuple>

namespace banana {

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok();
}

template <typename T>
[[nodiscard]] inline auto
as_result(std::tuple<boost::system::error_code, T> &&v) -> Result<T> {
  auto [ec, value] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok(std::move(value));
}

} // namespace banana
