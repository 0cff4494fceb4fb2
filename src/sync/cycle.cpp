#include "dirsync/sync/cycle.hpp"
#include "dirsync/events/events.hpp"
#include "dirsync/queue/bootstrap.hpp"
#include "dirsync/snapshot/diff.hpp"

#include <spdlog/spdlog.h>

namespace dirsync::sync {

SyncCycle::SyncCycle(CycleContext context)
    : context_(std::move(context)) {}

Result<CycleReport> SyncCycle::run() {
    if (state_.state() != CycleState::Idle) {
        return Err<CycleReport>(std::string("A cycle can only run once; state is ") +
                                CycleStateMachine::to_string(state_.state()));
    }

    const auto started = std::chrono::steady_clock::now();
    CycleReport report;

    spdlog::info("[Cycle] starting client={} queue={}", context_.client_id, context_.queue_name);

    advance(CycleState::PreparingQueue);
    if (auto prepared = prepare_queue(report); prepared.is_error()) {
        return fail(prepared.error());
    }

    advance(CycleState::LoadingSnapshots);
    auto final_snapshot = build_final_snapshot(report);
    if (final_snapshot.is_error()) {
        return fail(final_snapshot.error());
    }

    advance(CycleState::Submitting);
    auto plan = submit(final_snapshot.value(), report);
    if (plan.is_error()) {
        return fail(plan.error());
    }

    advance(CycleState::ApplyingActions);
    report.execution = context_.executor.apply(plan.value());

    advance(CycleState::Complete);
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    context_.bus.emit(events::CycleCompletedEvent{context_.client_id,
                                                  report.execution.succeeded(),
                                                  report.execution.failed(),
                                                  report.execution.unknown,
                                                  report.duration});
    return Ok(std::move(report));
}

Result<void> SyncCycle::prepare_queue(CycleReport& report) {
    queue::QueueBootstrap bootstrap(context_.queue);
    auto purged = bootstrap.prepare(context_.queue_name);
    if (purged.is_error()) {
        return Err<void>(purged.error());
    }

    report.purged_messages = purged.value();
    context_.bus.emit(events::QueuePreparedEvent{context_.queue_name, purged.value()});
    return Ok();
}

Result<snapshot::DirectorySnapshot> SyncCycle::build_final_snapshot(CycleReport& report) {
    std::optional<snapshot::DirectorySnapshot> last;
    auto loaded = context_.store.load_last();
    if (loaded.is_error()) {
        spdlog::warn("[Cycle] last snapshot unusable, treating as first run: {}", loaded.error());
    } else {
        last = loaded.take_value();
    }

    auto current = context_.store.capture_current();
    if (current.is_error()) {
        return Err<snapshot::DirectorySnapshot>(std::string("Failed to read local metadata: ") + current.error());
    }

    if (!last) {
        spdlog::info("[Cycle] no last snapshot, sending current snapshot as-is");
        report.first_run = true;
        return current;
    }

    advance(CycleState::Reconciling);
    auto merged = snapshot::reconcile(*last, current.value());
    spdlog::debug("[Cycle] reconciled last={} current={} merged={}", last->size(), current.value().size(), merged.size());
    return Ok(std::move(merged));
}

Result<std::optional<snapshot::SyncActionPlan>> SyncCycle::submit(const snapshot::DirectorySnapshot& final_snapshot,
                                                                  CycleReport& report) {
    report.submitted_entries = final_snapshot.size();
    report.tombstones = snapshot::tombstone_count(final_snapshot);

    auto plan = context_.protocol.submit_snapshot(context_.client_id, final_snapshot);
    if (plan.is_error()) {
        return plan;
    }

    report.plan_received = plan.value().has_value();
    report.planned_actions = plan.value() ? plan.value()->size() : 0;

    context_.bus.emit(events::SnapshotSubmittedEvent{context_.client_id,
                                                     report.submitted_entries,
                                                     report.tombstones,
                                                     report.first_run,
                                                     report.planned_actions});
    return plan;
}

Result<CycleReport> SyncCycle::fail(const std::string& error) {
    const std::string stage = CycleStateMachine::to_string(state_.state());
    if (auto marked = state_.mark_failed(error); marked.is_error()) {
        spdlog::error("[Cycle] could not record failure: {}", marked.error());
    }
    context_.bus.emit(events::CycleFailedEvent{context_.client_id, stage, error});
    return Err<CycleReport>(stage + ": " + error);
}

void SyncCycle::advance(CycleState next) {
    auto moved = state_.transition_to(next);
    if (moved.is_error()) {
        spdlog::error("[Cycle] {}", moved.error());
    }
}

} // namespace dirsync::sync
