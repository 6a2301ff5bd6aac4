#pragma once

#include "banana/core/error.hpp"
#include "banana/util/log.hpp"

#include <glaze/toml.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace banana::toml_util {

inline constexpr auto kReadOpts =
    glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
inline constexpr auto kWriteOpts = glz::opts{.format = glz::TOML};

[[nodiscard]] inline auto read_file(const std::filesystem::path &path)
    -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Writes `content` to `path`, creating parent directories. The file is
/// replaced through a sibling temp file so readers never see a partial write.
[[nodiscard]] inline auto write_file(const std::filesystem::path &path,
                                     std::string_view content)
    -> Result<void> {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      log::error("Cannot create {}: {}", path.parent_path().string(),
                 ec.message());
      return fail(Error::FileOpenFailed);
    }
  }

  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return fail(Error::FileOpenFailed);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
      return fail(Error::FileOpenFailed);
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    log::error("Cannot replace {}: {}", path.string(), ec.message());
    std::filesystem::remove(tmp, ec);
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

/// Parse TOML text into a glaze-compatible struct T.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text,
                              std::string *diagnostic = nullptr) -> Result<T> {
  T raw{};
  if (auto ec = glz::read<kReadOpts>(raw, text); ec) {
    auto detail = glz::format_error(ec, text);
    log::error("TOML parse error: {}", detail);
    if (diagnostic) {
      *diagnostic = std::move(detail);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

template <typename T>
[[nodiscard]] auto dump_toml(const T &raw) -> Result<std::string> {
  auto out = glz::write<kWriteOpts>(raw);
  if (!out) {
    return fail(Error::ParseError);
  }
  return ok(std::move(*out));
}

} // namespace banana::toml_util
