#pragma once

#include "dirsync/core/result.hpp"
#include "dirsync/snapshot/scanner.hpp"
#include "dirsync/snapshot/types.hpp"

#include <filesystem>
#include <optional>

namespace dirsync::snapshot {

/**
 * @brief Source of the snapshots a sync cycle works with
 *
 * load_last() returns an empty optional on the first run. commit()
 * captures the live directory and persists it as the next baseline.
 */
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual Result<std::optional<DirectorySnapshot>> load_last() = 0;
    virtual Result<DirectorySnapshot> capture_current() = 0;
    virtual Result<DirectorySnapshot> commit() = 0;
};

/**
 * @brief Snapshot store backed by a JSON file next to the sync root
 */
class FileSnapshotStore : public SnapshotStore {
public:
    FileSnapshotStore(std::filesystem::path sync_root, std::filesystem::path snapshot_path);

    Result<std::optional<DirectorySnapshot>> load_last() override;
    Result<DirectorySnapshot> capture_current() override;
    Result<DirectorySnapshot> commit() override;

    /// Atomically replace the persisted baseline
    Result<void> save(const DirectorySnapshot& snapshot) const;

private:
    std::filesystem::path snapshot_path_;
    DirectoryScanner scanner_;
};

} // namespace dirsync::snapshot
