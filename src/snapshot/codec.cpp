#include "dirsync/snapshot/codec.hpp"
#include "dirsync/core/paths.hpp"

namespace dirsync::snapshot {
using json = nlohmann::json;

json record_to_json(const FileRecord& record) {
    json j;
    j["path"] = record.path;
    j["status"] = FileStatusUtils::to_string(record.status);
    j["is_directory"] = record.is_directory;
    j["size"] = record.size;
    j["modified_time"] = static_cast<std::int64_t>(record.modified_time);
    j["hash"] = record.hash;
    return j;
}

Result<FileRecord> record_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<FileRecord>(std::string("File record is not an object"));
    }

    const auto path_it = j.find("path");
    if (path_it == j.end() || !path_it->is_string() || path_it->get<std::string>().empty()) {
        return Err<FileRecord>(std::string("File record has no path"));
    }

    FileRecord record;
    record.path = path_it->get<std::string>();

    try {
        const std::string status_text = j.value("status", std::string("present"));
        const auto status = FileStatusUtils::from_string(status_text);
        if (!status) {
            return Err<FileRecord>(std::string("Unknown status '") + status_text + "' for " + record.path);
        }
        record.status = *status;
        record.is_directory = j.value("is_directory", false);
        if (const auto size_it = j.find("size"); size_it != j.end() && !size_it->is_null()) {
            const bool non_negative = size_it->is_number_unsigned() ||
                                      (size_it->is_number_integer() && size_it->get<std::int64_t>() >= 0);
            if (!non_negative) {
                return Err<FileRecord>(std::string("Size of ") + record.path + " is not a non-negative integer");
            }
            record.size = size_it->get<std::uint64_t>();
        }
        record.modified_time = static_cast<std::time_t>(j.value("modified_time", static_cast<std::int64_t>(0)));
        record.hash = j.value("hash", std::string{});
    } catch (const json::exception& e) {
        return Err<FileRecord>(std::string("Malformed record for ") + record.path + ": " + e.what());
    }

    return Ok(std::move(record));
}

json snapshot_to_json(const DirectorySnapshot& snapshot) {
    json files = json::object();
    for (const auto& [path, record] : snapshot.files) {
        files[path] = record_to_json(record);
    }
    return json{{"files", files}};
}

Result<DirectorySnapshot> snapshot_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<DirectorySnapshot>(std::string("Snapshot is not an object"));
    }

    DirectorySnapshot snapshot;
    const auto files_it = j.find("files");
    if (files_it == j.end() || files_it->is_null()) {
        return Ok(std::move(snapshot));
    }
    if (!files_it->is_object()) {
        return Err<DirectorySnapshot>(std::string("Snapshot 'files' is not an object"));
    }

    for (const auto& [path, entry] : files_it->items()) {
        auto normalized = PathMapper::normalize(path);
        if (normalized.is_error()) {
            return Err<DirectorySnapshot>(std::string("Invalid snapshot path '") + path + "': " + normalized.error());
        }
        if (normalized.value() != path) {
            return Err<DirectorySnapshot>(std::string("Snapshot path '") + path + "' is not normalized");
        }

        auto record = record_from_json(entry);
        if (record.is_error()) {
            return Err<DirectorySnapshot>(record.error());
        }
        if (record.value().path != path) {
            return Err<DirectorySnapshot>(std::string("Record path '") + record.value().path +
                                          "' does not match key '" + path + "'");
        }
        snapshot.files.emplace(path, record.take_value());
    }

    return Ok(std::move(snapshot));
}

json plan_to_json(const SyncActionPlan& plan) {
    json files = json::object();
    for (const auto& [path, directive] : plan.files) {
        const std::string action = directive.action == FileAction::Unknown
            ? directive.raw_action
            : FileActionUtils::to_string(directive.action);
        files[path] = json{{"action", action}};
    }
    return json{{"files", files}};
}

Result<SyncActionPlan> plan_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<SyncActionPlan>(std::string("Action plan is not an object"));
    }

    SyncActionPlan plan;
    const auto files_it = j.find("files");
    if (files_it == j.end() || files_it->is_null()) {
        return Ok(std::move(plan));
    }
    if (!files_it->is_object()) {
        return Err<SyncActionPlan>(std::string("Action plan 'files' is not an object"));
    }

    for (const auto& [path, entry] : files_it->items()) {
        if (!entry.is_object()) {
            return Err<SyncActionPlan>(std::string("Directive for ") + path + " is not an object");
        }

        FileActionDirective directive;
        const auto action_it = entry.find("action");
        if (action_it != entry.end() && action_it->is_string()) {
            directive.raw_action = action_it->get<std::string>();
        } else if (action_it != entry.end()) {
            directive.raw_action = action_it->dump();
        }
        directive.action = FileActionUtils::from_string(directive.raw_action);
        plan.files.emplace(path, std::move(directive));
    }

    return Ok(std::move(plan));
}

} // namespace dirsync::snapshot
