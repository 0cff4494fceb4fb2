#include "dirsync/snapshot/diff.hpp"

namespace dirsync::snapshot {

DirectorySnapshot reconcile(const DirectorySnapshot& last, const DirectorySnapshot& current) {
    DirectorySnapshot merged;

    for (const auto& [path, record] : last.files) {
        if (current.contains(path)) {
            continue;
        }
        FileRecord tombstone = record;
        tombstone.path = path;
        tombstone.status = FileStatus::Deleted;
        merged.files.emplace(path, std::move(tombstone));
    }

    // Current presence overrides any tombstone for the same path
    for (const auto& [path, record] : current.files) {
        merged.files[path] = record;
    }

    return merged;
}

std::size_t tombstone_count(const DirectorySnapshot& snapshot) {
    std::size_t count = 0;
    for (const auto& [_, record] : snapshot.files) {
        if (record.is_tombstone()) {
            ++count;
        }
    }
    return count;
}

} // namespace dirsync::snapshot
