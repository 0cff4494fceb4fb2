#pragma once

#include "dirsync/core/result.hpp"
#include "dirsync/snapshot/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dirsync::snapshot {

/**
 * @brief Walks the sync root and records metadata for every entry
 *
 * Produces one Present record per regular file and per directory. Paths
 * listed as excluded (and everything below them) are skipped, which keeps
 * the client's own metadata directory out of its snapshots. Entries whose
 * names are not valid UTF-8 are skipped with a warning.
 */
class DirectoryScanner {
public:
    explicit DirectoryScanner(std::filesystem::path root,
                              std::vector<std::filesystem::path> excluded = {});

    Result<DirectorySnapshot> scan() const;

    const std::filesystem::path& root() const noexcept { return root_; }

    /// FNV-1a 64 of the file's bytes as 16 lowercase hex digits
    static Result<std::string> hash_file(const std::filesystem::path& path);

private:
    bool is_excluded(const std::filesystem::path& absolute) const;

    Result<FileRecord> build_record(const std::filesystem::directory_entry& entry,
                                    const std::string& normalized) const;

    std::filesystem::path root_;
    std::vector<std::filesystem::path> excluded_;
};

} // namespace dirsync::snapshot
