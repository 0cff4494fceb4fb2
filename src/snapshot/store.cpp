#include "dirsync/snapshot/store.hpp"
#include "dirsync/core/paths.hpp"
#include "dirsync/snapshot/codec.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace dirsync::snapshot {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::vector<fs::path> excluded_paths(const fs::path& sync_root, const fs::path& snapshot_path) {
    return {sync_root / kMetadataDirName, snapshot_path, fs::path(snapshot_path).concat(".tmp")};
}

} // namespace

FileSnapshotStore::FileSnapshotStore(fs::path sync_root, fs::path snapshot_path)
    : snapshot_path_(std::move(snapshot_path)),
      scanner_(sync_root, excluded_paths(sync_root, snapshot_path_)) {}

Result<std::optional<DirectorySnapshot>> FileSnapshotStore::load_last() {
    std::error_code ec;
    if (!fs::exists(snapshot_path_, ec)) {
        if (ec) {
            return Err<std::optional<DirectorySnapshot>>(
                std::string("Failed to check snapshot file: ") + ec.message());
        }
        return Ok(std::optional<DirectorySnapshot>{});
    }

    std::ifstream input(snapshot_path_, std::ios::binary);
    if (!input) {
        return Err<std::optional<DirectorySnapshot>>(
            std::string("Failed to open snapshot file: ") + snapshot_path_.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return Err<std::optional<DirectorySnapshot>>(
            std::string("Snapshot file is not valid JSON: ") + snapshot_path_.string());
    }

    auto snapshot = snapshot_from_json(document);
    if (snapshot.is_error()) {
        return Err<std::optional<DirectorySnapshot>>(snapshot.error());
    }
    return Ok(std::optional<DirectorySnapshot>(snapshot.take_value()));
}

Result<DirectorySnapshot> FileSnapshotStore::capture_current() {
    return scanner_.scan();
}

Result<DirectorySnapshot> FileSnapshotStore::commit() {
    auto current = scanner_.scan();
    if (current.is_error()) {
        return current;
    }
    if (auto saved = save(current.value()); saved.is_error()) {
        return Err<DirectorySnapshot>(saved.error());
    }
    return current;
}

Result<void> FileSnapshotStore::save(const DirectorySnapshot& snapshot) const {
    std::error_code ec;
    const auto parent = snapshot_path_.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        std::error_code check_ec;
        if (ec && !fs::is_directory(parent, check_ec)) {
            return Err<void>(std::string("Failed to create directory: ") + parent.string());
        }
    }

    std::string serialized;
    try {
        serialized = snapshot_to_json(snapshot).dump(2);
    } catch (const json::exception& e) {
        return Err<void>(std::string("Failed to serialize snapshot: ") + e.what());
    }

    const fs::path temp_path = fs::path(snapshot_path_).concat(".tmp");
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(std::string("Failed to open snapshot file for writing: ") + temp_path.string());
        }
        output << serialized;
        output.flush();
        if (!output) {
            return Err<void>(std::string("Failed to write snapshot file: ") + temp_path.string());
        }
    }

    fs::rename(temp_path, snapshot_path_, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return Err<void>(std::string("Failed to move snapshot into place: ") + snapshot_path_.string() +
                         ": " + ec.message());
    }
    return Ok();
}

} // namespace dirsync::snapshot
