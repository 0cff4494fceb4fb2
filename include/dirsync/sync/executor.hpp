#pragma once

#include "dirsync/core/paths.hpp"
#include "dirsync/core/result.hpp"
#include "dirsync/events/event_bus.hpp"
#include "dirsync/snapshot/store.hpp"
#include "dirsync/snapshot/types.hpp"
#include "dirsync/sync/transfer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace dirsync::sync {

struct FailedAction {
    std::string path;
    snapshot::FileAction action = snapshot::FileAction::Unknown;
    std::string error;
};

/**
 * @brief Outcome of applying one action plan
 */
struct ExecutionReport {
    std::size_t uploaded = 0;
    std::size_t downloaded = 0;
    std::size_t directories_created = 0;
    std::size_t unknown = 0;
    std::vector<FailedAction> failures;

    bool snapshot_refreshed = false;
    std::string refresh_error;      ///< Set when the post-sync snapshot failed

    std::size_t succeeded() const { return uploaded + downloaded + directories_created; }
    std::size_t failed() const { return failures.size(); }
};

/**
 * @brief Applies a server action plan to the sync root
 *
 * Directives are independent: a failing directive is reported and the
 * next one still runs. Once every directive has been attempted the live
 * directory is captured and persisted as the new baseline, also when the
 * plan is absent or some directives failed.
 */
class ActionExecutor {
public:
    ActionExecutor(std::string client_id,
                   PathMapper paths,
                   FileTransfer& transfer,
                   DirectoryCreator& directories,
                   snapshot::SnapshotStore& store,
                   events::EventBus& bus);

    ExecutionReport apply(const std::optional<snapshot::SyncActionPlan>& plan);

private:
    /// Run one directive; the success value is the detail to report
    Result<std::string> execute(const std::string& path, snapshot::FileAction action);

    void record_failure(ExecutionReport& report, const std::string& path,
                        snapshot::FileAction action, const std::string& error);

    void refresh_snapshot(ExecutionReport& report);

    std::string client_id_;
    PathMapper paths_;
    FileTransfer& transfer_;
    DirectoryCreator& directories_;
    snapshot::SnapshotStore& store_;
    events::EventBus& bus_;
};

} // namespace dirsync::sync
