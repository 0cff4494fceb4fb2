#pragma once

/**
 * @file types.hpp
 * @brief Snapshot and action-plan types exchanged with the sync server
 *
 * A DirectorySnapshot maps normalized paths to FileRecords. Deletions are
 * not expressed by omission: a removed path stays in the snapshot as a
 * tombstone (FileStatus::Deleted) so the server can propagate it.
 *
 * The server answers a snapshot with a SyncActionPlan, one directive per
 * path the client has to act on.
 */

#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <string>

namespace dirsync {
namespace snapshot {

enum class FileStatus {
    Present,
    Deleted     // Tombstone; content metadata is kept only for audit
};

/**
 * @brief Metadata for one path inside the sync root
 *
 * Content fields (size, modified_time, hash) are meaningful only while the
 * record is Present. Directories carry size 0 and an empty hash.
 */
struct FileRecord {
    std::string path;             // Normalized, root-relative ("docs/a.txt")
    FileStatus status = FileStatus::Present;
    bool is_directory = false;
    std::uint64_t size = 0;
    std::time_t modified_time = 0;
    std::string hash;             // FNV-1a 64 content hash, 16 hex digits

    bool is_tombstone() const { return status == FileStatus::Deleted; }

    bool operator==(const FileRecord& other) const {
        return path == other.path && status == other.status &&
               is_directory == other.is_directory && size == other.size &&
               modified_time == other.modified_time && hash == other.hash;
    }
    bool operator!=(const FileRecord& other) const { return !(*this == other); }
};

/**
 * @brief Point-in-time view of the sync root, keyed by normalized path
 *
 * Ordered so serialization and iteration are deterministic.
 */
struct DirectorySnapshot {
    std::map<std::string, FileRecord> files;

    bool empty() const { return files.empty(); }
    std::size_t size() const { return files.size(); }

    bool contains(const std::string& path) const {
        return files.find(path) != files.end();
    }

    /// Insert or replace the record stored under record.path
    void put(FileRecord record) {
        auto key = record.path;
        files[key] = std::move(record);
    }

    bool operator==(const DirectorySnapshot& other) const { return files == other.files; }
    bool operator!=(const DirectorySnapshot& other) const { return !(*this == other); }
};

enum class FileAction {
    Upload,
    Download,
    Mkdir,
    Unknown     // Anything the client does not understand; skipped
};

struct FileActionDirective {
    FileAction action = FileAction::Unknown;
    std::string raw_action;       // Action text exactly as received
};

/**
 * @brief Server-issued corrective actions, one per normalized path
 */
struct SyncActionPlan {
    std::map<std::string, FileActionDirective> files;

    bool empty() const { return files.empty(); }
    std::size_t size() const { return files.size(); }
};

class FileStatusUtils {
public:
    static std::optional<FileStatus> from_string(const std::string& text) {
        if (text == "present") return FileStatus::Present;
        if (text == "deleted") return FileStatus::Deleted;
        return std::nullopt;
    }

    static std::string to_string(FileStatus status) {
        switch (status) {
            case FileStatus::Present: return "present";
            case FileStatus::Deleted: return "deleted";
            default: return "present";
        }
    }
};

class FileActionUtils {
public:
    static FileAction from_string(const std::string& text) {
        if (text == "upload") return FileAction::Upload;
        if (text == "download") return FileAction::Download;
        if (text == "mkdir") return FileAction::Mkdir;
        return FileAction::Unknown;
    }

    static std::string to_string(FileAction action) {
        switch (action) {
            case FileAction::Upload: return "upload";
            case FileAction::Download: return "download";
            case FileAction::Mkdir: return "mkdir";
            default: return "unknown";
        }
    }
};

} // namespace snapshot
} // namespace dirsync
