#pragma once

#include "dirsync/snapshot/types.hpp"

#include <cstddef>

namespace dirsync::snapshot {

/**
 * @brief Merge the last known snapshot with the freshly observed one
 *
 * Paths present in last but absent from current become tombstones that
 * keep last's metadata. Every record of current is copied verbatim and
 * wins over anything recorded for the same path in last. The result's
 * path set is the union of both inputs.
 */
DirectorySnapshot reconcile(const DirectorySnapshot& last, const DirectorySnapshot& current);

/// Number of tombstone records in a snapshot
std::size_t tombstone_count(const DirectorySnapshot& snapshot);

} // namespace dirsync::snapshot
