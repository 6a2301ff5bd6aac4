#pragma once

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace banana::util {

/// Lowercase hex SHA-256 of `data`; empty on OpenSSL failure.
[[nodiscard]] inline auto sha256_hex(std::string_view data) -> std::string {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), md.data(), &len, EVP_sha256(),
                 nullptr) != 1) {
    return {};
  }
  std::string out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    std::format_to(std::back_inserter(out), "{:02x}", md[i]);
  }
  return out;
}

} // namespace banana::util
