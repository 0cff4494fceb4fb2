#pragma once

#include "dirsync/core/result.hpp"
#include "dirsync/snapshot/types.hpp"

#include <nlohmann/json.hpp>

namespace dirsync::snapshot {

nlohmann::json record_to_json(const FileRecord& record);
Result<FileRecord> record_from_json(const nlohmann::json& j);

/// {"files": {<path>: record, ...}}
nlohmann::json snapshot_to_json(const DirectorySnapshot& snapshot);
Result<DirectorySnapshot> snapshot_from_json(const nlohmann::json& j);

/// {"files": {<path>: {"action": "..."}, ...}}
nlohmann::json plan_to_json(const SyncActionPlan& plan);
Result<SyncActionPlan> plan_from_json(const nlohmann::json& j);

} // namespace dirsync::snapshot
