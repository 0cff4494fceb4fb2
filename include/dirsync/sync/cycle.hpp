#pragma once

#include "dirsync/core/result.hpp"
#include "dirsync/events/event_bus.hpp"
#include "dirsync/queue/message_queue.hpp"
#include "dirsync/snapshot/store.hpp"
#include "dirsync/sync/cycle_state.hpp"
#include "dirsync/sync/executor.hpp"
#include "dirsync/sync/protocol.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace dirsync::sync {

/**
 * @brief Everything one sync cycle works with, built once at startup
 */
struct CycleContext {
    std::string client_id;
    std::string queue_name;
    queue::MessageQueue& queue;
    snapshot::SnapshotStore& store;
    SyncProtocolClient& protocol;
    ActionExecutor& executor;
    events::EventBus& bus;
};

struct CycleReport {
    std::size_t purged_messages = 0;
    bool first_run = false;
    std::size_t submitted_entries = 0;
    std::size_t tombstones = 0;
    bool plan_received = false;
    std::size_t planned_actions = 0;
    ExecutionReport execution;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief One bootstrap -> load -> diff -> submit -> execute pass
 *
 * Fatal stage errors (queue declare/purge, reading the live directory,
 * snapshot submission) stop the cycle before anything is applied and
 * leave the persisted baseline untouched, so the next run starts from the
 * same state. Per-file failures never stop the cycle.
 */
class SyncCycle {
public:
    explicit SyncCycle(CycleContext context);

    Result<CycleReport> run();

    const CycleStateMachine& state() const noexcept { return state_; }

private:
    Result<void> prepare_queue(CycleReport& report);
    Result<snapshot::DirectorySnapshot> build_final_snapshot(CycleReport& report);
    Result<std::optional<snapshot::SyncActionPlan>> submit(const snapshot::DirectorySnapshot& final_snapshot,
                                                           CycleReport& report);

    Result<CycleReport> fail(const std::string& error);
    void advance(CycleState next);

    CycleContext context_;
    CycleStateMachine state_;
};

} // namespace dirsync::sync
