#include "banana/generation/artifact_store.hpp"

#include "banana/generation/gemini_protocol.hpp"
#include "banana/util/digest.hpp"
#include "banana/util/log.hpp"

#include <format>
#include <fstream>
#include <iterator>

namespace banana {

namespace {
constexpr std::size_t kDigestPrefixLength = 16;
}

auto ArtifactStore::artifact_name(std::string_view bytes,
                                  std::string_view mime_type) -> std::string {
  auto digest = util::sha256_hex(bytes);
  return std::format("img_{}.{}", digest.substr(0, kDigestPrefixLength),
                     gemini::extension_for_mime(mime_type));
}

auto ArtifactStore::store(const std::filesystem::path &directory,
                          std::string_view bytes,
                          std::string_view mime_type) const
    -> Result<std::string> {
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    log::error("Cannot create output directory {}: {}", directory.string(),
               ec.message());
    return fail(Error::FileOpenFailed);
  }

  const auto path = directory / artifact_name(bytes, mime_type);
  if (std::filesystem::exists(path, ec) &&
      std::filesystem::file_size(path, ec) == bytes.size() && !ec) {
    log::debug("Artifact {} already present", path.string());
    return ok(path.string());
  }

  auto tmp = path;
  tmp += ".part";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      log::error("Failed to write {}", tmp.string());
      return fail(Error::FileOpenFailed);
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    log::error("Failed to move {} into place: {}", path.string(),
               ec.message());
    std::filesystem::remove(tmp, ec);
    return fail(Error::FileOpenFailed);
  }

  log::info("Saved image to {}", path.string());
  return ok(path.string());
}

auto read_binary_file(const std::filesystem::path &path)
    -> Result<std::string> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return fail(Error::FileNotFound);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileOpenFailed);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

} // namespace banana
