#pragma once

#include "banana/core/error.hpp"

#include <boost/beast/core/detail/base64.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace banana::util {

[[nodiscard]] inline auto base64_encode(std::span<const std::byte> data)
    -> std::string {
  std::string result(boost::beast::detail::base64::encoded_size(data.size()),
                     '\0');
  auto written = boost::beast::detail::base64::encode(result.data(),
                                                      data.data(), data.size());
  result.resize(written);
  return result;
}

[[nodiscard]] inline auto base64_encode(std::string_view data) -> std::string {
  return base64_encode(std::as_bytes(std::span{data.data(), data.size()}));
}

[[nodiscard]] inline auto base64_decode(std::string_view encoded)
    -> Result<std::string> {
  std::string out(boost::beast::detail::base64::decoded_size(encoded.size()),
                   '\0');
  auto [written, consumed] = boost::beast::detail::base64::decode(
      out.data(), encoded.data(), encoded.size());
  if (consumed != encoded.size()) {
    return fail(Error::ParseError);
  }
  out.resize(written);
  return ok(std::move(out));
}

} // namespace banana::util
