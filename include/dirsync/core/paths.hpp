#pragma once

#include "dirsync/core/result.hpp"

#include <filesystem>
#include <string>

namespace dirsync {

/// Client-private directory under the sync root; never synced
inline constexpr const char* kMetadataDirName = ".dirsync";

/// Wire paths travel as JSON strings, which must be well-formed UTF-8
bool is_valid_utf8(const std::string& text);

/**
 * @brief Maps between wire paths and local filesystem paths
 *
 * Wire (normalized) paths are relative to the sync root, '/'-separated and
 * lexically normal. They never start with '/' and never climb out of the
 * root with "..".
 */
class PathMapper {
public:
    explicit PathMapper(std::filesystem::path root);

    const std::filesystem::path& root() const noexcept { return root_; }

    /// Resolve a normalized path to an absolute local path under the root
    Result<std::filesystem::path> to_local(const std::string& normalized) const;

    /// Convert a local path under the root into its normalized form
    Result<std::string> to_normalized(const std::filesystem::path& local) const;

    /// Validate and canonicalise a wire path ("a//b/./c" -> "a/b/c").
    /// Paths that are not valid UTF-8 are rejected.
    static Result<std::string> normalize(const std::string& path);

private:
    std::filesystem::path root_;
};

} // namespace dirsync
