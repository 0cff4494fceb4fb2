#include "dirsync/snapshot/scanner.hpp"
#include "dirsync/core/paths.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace dirsync::snapshot {
namespace fs = std::filesystem;

namespace {

std::time_t to_time_t(fs::file_time_type time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        time - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(system_time);
}

fs::path normalise_absolute(const fs::path& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    absolute = absolute.lexically_normal();
    if (!absolute.has_filename() && absolute.has_relative_path()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

bool is_within(const fs::path& candidate, const fs::path& base) {
    auto rel = candidate.lexically_relative(base);
    if (rel.empty()) {
        return false;
    }
    const auto first = *rel.begin();
    return first != "..";
}

} // namespace

DirectoryScanner::DirectoryScanner(fs::path root, std::vector<fs::path> excluded)
    : root_(normalise_absolute(root)) {
    excluded_.reserve(excluded.size());
    for (const auto& path : excluded) {
        excluded_.push_back(normalise_absolute(path));
    }
}

Result<DirectorySnapshot> DirectoryScanner::scan() const {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return Err<DirectorySnapshot>(std::string("Sync root is not a directory: ") + root_.string());
    }

    DirectorySnapshot snapshot;
    std::error_code walk_ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::none, walk_ec);
    if (walk_ec) {
        return Err<DirectorySnapshot>(std::string("Failed to open sync root: ") + walk_ec.message());
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(walk_ec)) {
        if (walk_ec) {
            return Err<DirectorySnapshot>(std::string("Failed to walk sync root: ") + walk_ec.message());
        }

        const auto& entry = *it;
        std::error_code entry_ec;
        if (is_excluded(entry.path())) {
            if (entry.is_directory(entry_ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (entry.is_symlink(entry_ec)) {
            continue;
        }
        const bool directory = entry.is_directory(entry_ec);
        if (!directory && !entry.is_regular_file(entry_ec)) {
            continue;
        }

        const std::string normalized = entry.path().lexically_relative(root_).generic_string();
        if (normalized.empty() || normalized == ".") {
            continue;
        }
        if (!is_valid_utf8(normalized)) {
            // Cannot be expressed on the wire; leave it and its children local-only
            spdlog::warn("[Scanner] skipping path with non UTF-8 name: {}", entry.path().filename().string());
            if (directory) {
                it.disable_recursion_pending();
            }
            continue;
        }

        auto record = build_record(entry, normalized);
        if (record.is_error()) {
            return Err<DirectorySnapshot>(record.error());
        }
        snapshot.files.emplace(normalized, record.take_value());
    }

    if (walk_ec) {
        return Err<DirectorySnapshot>(std::string("Failed to walk sync root: ") + walk_ec.message());
    }

    return Ok(std::move(snapshot));
}

Result<std::string> DirectoryScanner::hash_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(std::string("Failed to open file for hashing: ") + path.string());
    }

    const std::uint64_t offset = 0xcbf29ce484222325ULL;
    const std::uint64_t prime  = 0x100000001b3ULL;
    std::uint64_t hash = offset;
    char buffer[4096];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const std::streamsize count = input.gcount();
        for (std::streamsize i = 0; i < count; ++i) {
            hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(buffer[i]));
            hash *= prime;
        }
    }
    if (input.bad()) {
        return Err<std::string>(std::string("Failed to read file: ") + path.string());
    }

    std::ostringstream hex;
    hex << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return Ok(hex.str());
}

bool DirectoryScanner::is_excluded(const fs::path& absolute) const {
    const auto normal = absolute.lexically_normal();
    for (const auto& excluded : excluded_) {
        if (normal == excluded || is_within(normal, excluded)) {
            return true;
        }
    }
    return false;
}

Result<FileRecord> DirectoryScanner::build_record(const fs::directory_entry& entry,
                                                  const std::string& normalized) const {
    std::error_code ec;
    FileRecord record;
    record.path = normalized;
    record.status = FileStatus::Present;
    record.is_directory = entry.is_directory(ec);

    const auto write_time = entry.last_write_time(ec);
    if (ec) {
        return Err<FileRecord>(std::string("Failed to stat ") + normalized + ": " + ec.message());
    }
    record.modified_time = to_time_t(write_time);

    if (record.is_directory) {
        return Ok(std::move(record));
    }

    record.size = entry.file_size(ec);
    if (ec) {
        return Err<FileRecord>(std::string("Failed to stat ") + normalized + ": " + ec.message());
    }

    auto hash = hash_file(entry.path());
    if (hash.is_error()) {
        return Err<FileRecord>(hash.error());
    }
    record.hash = hash.take_value();
    return Ok(std::move(record));
}

} // namespace dirsync::snapshot
