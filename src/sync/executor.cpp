#include "dirsync/sync/executor.hpp"
#include "dirsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace dirsync::sync {
using snapshot::FileAction;

ActionExecutor::ActionExecutor(std::string client_id,
                               PathMapper paths,
                               FileTransfer& transfer,
                               DirectoryCreator& directories,
                               snapshot::SnapshotStore& store,
                               events::EventBus& bus)
    : client_id_(std::move(client_id)),
      paths_(std::move(paths)),
      transfer_(transfer),
      directories_(directories),
      store_(store),
      bus_(bus) {}

ExecutionReport ActionExecutor::apply(const std::optional<snapshot::SyncActionPlan>& plan) {
    ExecutionReport report;

    if (!plan || plan->empty()) {
        spdlog::info("[Executor] no sync actions to process");
    } else {
        spdlog::info("[Executor] processing {} action(s)", plan->size());
        for (const auto& [path, directive] : plan->files) {
            if (directive.action == FileAction::Unknown) {
                report.unknown++;
                bus_.emit(events::UnknownActionEvent{path, directive.raw_action});
                continue;
            }

            spdlog::debug("[Executor] action={} path={}", snapshot::FileActionUtils::to_string(directive.action), path);

            Result<std::string> outcome = Err<std::string>(std::string("not attempted"));
            try {
                outcome = execute(path, directive.action);
            } catch (const std::exception& e) {
                outcome = Err<std::string>(std::string("Unexpected exception: ") + e.what());
            }

            if (outcome.is_error()) {
                record_failure(report, path, directive.action, outcome.error());
                continue;
            }

            switch (directive.action) {
                case FileAction::Upload: report.uploaded++; break;
                case FileAction::Download: report.downloaded++; break;
                case FileAction::Mkdir: report.directories_created++; break;
                default: break;
            }
            bus_.emit(events::ActionCompletedEvent{path, directive.action, outcome.value()});
        }
    }

    // Every directive has been attempted; only now capture the new baseline
    refresh_snapshot(report);
    return report;
}

Result<std::string> ActionExecutor::execute(const std::string& path, FileAction action) {
    switch (action) {
        case FileAction::Upload: {
            auto local = paths_.to_local(path);
            if (local.is_error()) {
                return Err<std::string>(local.error());
            }
            return transfer_.upload(local.value(), client_id_);
        }
        case FileAction::Download: {
            auto result = transfer_.download(path);
            if (result.is_error()) {
                return Err<std::string>(result.error());
            }
            return Ok(std::string());
        }
        case FileAction::Mkdir: {
            auto local = paths_.to_local(path);
            if (local.is_error()) {
                return Err<std::string>(local.error());
            }
            auto result = directories_.make_directory(local.value());
            if (result.is_error()) {
                return Err<std::string>(result.error());
            }
            return Ok(std::string());
        }
        default:
            return Err<std::string>(std::string("Unsupported action"));
    }
}

void ActionExecutor::record_failure(ExecutionReport& report, const std::string& path,
                                    FileAction action, const std::string& error) {
    report.failures.push_back(FailedAction{path, action, error});
    bus_.emit(events::ActionFailedEvent{path, action, error});
}

void ActionExecutor::refresh_snapshot(ExecutionReport& report) {
    auto refreshed = store_.commit();
    if (refreshed.is_error()) {
        report.snapshot_refreshed = false;
        report.refresh_error = refreshed.error();
        bus_.emit(events::SnapshotRefreshFailedEvent{refreshed.error()});
        return;
    }
    report.snapshot_refreshed = true;
    bus_.emit(events::SnapshotRefreshedEvent{refreshed.value().size()});
}

} // namespace dirsync::sync
