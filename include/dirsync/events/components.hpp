/**
 * @file components.hpp
 * @brief Event subscribers that log and count sync cycle activity
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every stage and directive outcome is now logged and counted
 */

#pragma once

#include "dirsync/events/event_bus.hpp"
#include "dirsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace dirsync::events {

/**
 * @brief Logs every sync event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<QueuePreparedEvent>([](const QueuePreparedEvent& e) {
            spdlog::info("[QueuePrepared] queue={} purged={}", e.queue_name, e.purged_messages);
        });

        bus_.subscribe<SnapshotSubmittedEvent>([](const SnapshotSubmittedEvent& e) {
            spdlog::info("[SnapshotSubmitted] client={} entries={} tombstones={} first_run={} actions={}",
                         e.client_id, e.entries, e.tombstones, e.first_run, e.planned_actions);
        });

        bus_.subscribe<ActionCompletedEvent>([](const ActionCompletedEvent& e) {
            if (e.detail.empty()) {
                spdlog::info("[ActionCompleted] action={} path={}",
                             snapshot::FileActionUtils::to_string(e.action), e.path);
            } else {
                spdlog::info("[ActionCompleted] action={} path={} url={}",
                             snapshot::FileActionUtils::to_string(e.action), e.path, e.detail);
            }
        });

        bus_.subscribe<ActionFailedEvent>([](const ActionFailedEvent& e) {
            spdlog::error("[ActionFailed] action={} path={} error={}",
                          snapshot::FileActionUtils::to_string(e.action), e.path, e.error);
        });

        bus_.subscribe<UnknownActionEvent>([](const UnknownActionEvent& e) {
            spdlog::warn("[UnknownAction] action='{}' path={}", e.raw_action, e.path);
        });

        bus_.subscribe<SnapshotRefreshedEvent>([](const SnapshotRefreshedEvent& e) {
            spdlog::info("[SnapshotRefreshed] entries={}", e.entries);
        });

        bus_.subscribe<SnapshotRefreshFailedEvent>([](const SnapshotRefreshFailedEvent& e) {
            spdlog::error("[SnapshotRefreshFailed] error={}", e.error);
        });

        bus_.subscribe<CycleCompletedEvent>([](const CycleCompletedEvent& e) {
            spdlog::info("[CycleCompleted] client={} succeeded={} failed={} skipped={} duration={}ms",
                         e.client_id, e.succeeded, e.failed, e.skipped, e.duration.count());
        });

        bus_.subscribe<CycleFailedEvent>([](const CycleFailedEvent& e) {
            spdlog::error("[CycleFailed] client={} stage={} error={}", e.client_id, e.stage, e.error);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counts directive outcomes and cycle results
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // ... run a cycle ...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_uploaded{0};
        std::atomic<uint64_t> files_downloaded{0};
        std::atomic<uint64_t> directories_created{0};
        std::atomic<uint64_t> actions_failed{0};
        std::atomic<uint64_t> actions_unknown{0};
        std::atomic<uint64_t> messages_purged{0};
        std::atomic<uint64_t> snapshots_submitted{0};
        std::atomic<uint64_t> tombstones_submitted{0};
        std::atomic<uint64_t> cycles_completed{0};
        std::atomic<uint64_t> cycles_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<QueuePreparedEvent>([this](const QueuePreparedEvent& e) {
            stats_.messages_purged += e.purged_messages;
        });

        bus_.subscribe<SnapshotSubmittedEvent>([this](const SnapshotSubmittedEvent& e) {
            stats_.snapshots_submitted++;
            stats_.tombstones_submitted += e.tombstones;
        });

        bus_.subscribe<ActionCompletedEvent>([this](const ActionCompletedEvent& e) {
            on_action_completed(e);
        });

        bus_.subscribe<ActionFailedEvent>([this](const ActionFailedEvent&) {
            stats_.actions_failed++;
        });

        bus_.subscribe<UnknownActionEvent>([this](const UnknownActionEvent&) {
            stats_.actions_unknown++;
        });

        bus_.subscribe<CycleCompletedEvent>([this](const CycleCompletedEvent&) {
            stats_.cycles_completed++;
        });

        bus_.subscribe<CycleFailedEvent>([this](const CycleFailedEvent&) {
            stats_.cycles_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Messages purged:     {}", stats_.messages_purged.load());
        spdlog::info("  Snapshots submitted: {}", stats_.snapshots_submitted.load());
        spdlog::info("  Tombstones sent:     {}", stats_.tombstones_submitted.load());
        spdlog::info("  Files uploaded:      {}", stats_.files_uploaded.load());
        spdlog::info("  Files downloaded:    {}", stats_.files_downloaded.load());
        spdlog::info("  Directories created: {}", stats_.directories_created.load());
        spdlog::info("  Actions failed:      {}", stats_.actions_failed.load());
        spdlog::info("  Actions unknown:     {}", stats_.actions_unknown.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_action_completed(const ActionCompletedEvent& e) {
        switch (e.action) {
            case snapshot::FileAction::Upload:
                stats_.files_uploaded++;
                break;
            case snapshot::FileAction::Download:
                stats_.files_downloaded++;
                break;
            case snapshot::FileAction::Mkdir:
                stats_.directories_created++;
                break;
            default:
                break;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace dirsync::events
