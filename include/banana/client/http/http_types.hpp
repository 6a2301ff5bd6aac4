#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace banana::http {

enum class HttpMethod : std::uint8_t { GET, POST };

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string target; // path + query
  HttpHeaders headers;
  std::string body;
};

struct HttpResponse {
  int status{0};
  HttpHeaders headers;
  std::string body;

  [[nodiscard]] auto is_success() const noexcept -> bool {
    return status >= 200 && status < 300;
  }

  [[nodiscard]] auto header(std::string_view name) const -> std::string_view;
};

} // namespace banana::http
