#pragma once

#include "banana/core/error.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace banana::util {

struct ParsedUrl {
  bool tls{true};
  std::string host;
  std::uint16_t port{443};
  // Path with no trailing slash ("/v1beta"); empty for the root.
  std::string base_path;
};

[[nodiscard]] inline auto parse_base_url(std::string_view url)
    -> Result<ParsedUrl> {
  auto parsed = boost::urls::parse_uri(url);
  if (!parsed) {
    return fail(Error::InvalidUrl);
  }
  const boost::urls::url_view &uri = *parsed;

  ParsedUrl out;
  if (uri.scheme() == "https") {
    out.tls = true;
    out.port = 443;
  } else if (uri.scheme() == "http") {
    out.tls = false;
    out.port = 80;
  } else {
    return fail(Error::InvalidUrl);
  }

  out.host = std::string(uri.host());
  if (out.host.empty()) {
    return fail(Error::InvalidUrl);
  }
  if (uri.has_port()) {
    if (uri.port_number() == 0) {
      return fail(Error::InvalidUrl);
    }
    out.port = uri.port_number();
  }

  out.base_path = std::string(uri.encoded_path());
  while (!out.base_path.empty() && out.base_path.back() == '/') {
    out.base_path.pop_back();
  }
  return out;
}

} // namespace banana::util
