#pragma once

#include "banana/core/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace banana {

// Writes generated images under content-addressed names, so storing the same
// bytes twice yields the same path and leaves a single file.
class ArtifactStore {
public:
  /// "img_<first 16 hex of sha256>.<ext>"
  [[nodiscard]] static auto artifact_name(std::string_view bytes,
                                          std::string_view mime_type)
      -> std::string;

  /// Creates `directory` if needed. Returns the path of the stored file.
  [[nodiscard]] auto store(const std::filesystem::path &directory,
                           std::string_view bytes,
                           std::string_view mime_type) const
      -> Result<std::string>;
};

/// Reads a whole file; FileNotFound / FileOpenFailed on error.
[[nodiscard]] auto read_binary_file(const std::filesystem::path &path)
    -> Result<std::string>;

} // namespace banana
