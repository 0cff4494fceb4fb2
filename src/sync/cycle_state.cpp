#include "dirsync/sync/cycle_state.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace dirsync::sync {
namespace {

bool is_progressive(CycleState current, CycleState target) {
    static const std::unordered_map<CycleState, std::vector<CycleState>> transitions {
        {CycleState::Idle, {CycleState::PreparingQueue}},
        {CycleState::PreparingQueue, {CycleState::LoadingSnapshots}},
        {CycleState::LoadingSnapshots, {CycleState::Reconciling, CycleState::Submitting}},
        {CycleState::Reconciling, {CycleState::Submitting}},
        {CycleState::Submitting, {CycleState::ApplyingActions}},
        {CycleState::ApplyingActions, {CycleState::Complete}},
    };

    if (target == CycleState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

CycleStateMachine::CycleStateMachine()
    : last_transition_(std::chrono::steady_clock::now()) {}

dirsync::Result<void> CycleStateMachine::transition_to(CycleState next_state) {
    if (state_ == next_state) {
        return dirsync::Ok();
    }

    if (!can_transition(next_state)) {
        return dirsync::Err<void>(std::string("Illegal cycle transition from ") + to_string(state_) +
                                  " to " + to_string(next_state));
    }

    state_ = next_state;
    last_transition_ = std::chrono::steady_clock::now();
    if (next_state != CycleState::Failed) {
        last_error_.clear();
    }
    return dirsync::Ok();
}

dirsync::Result<void> CycleStateMachine::mark_failed(std::string error_message) {
    if (state_ == CycleState::Complete) {
        return dirsync::Err<void>(std::string("Cycle already complete"));
    }
    last_error_ = std::move(error_message);
    return transition_to(CycleState::Failed);
}

std::string CycleStateMachine::to_string(CycleState state) {
    switch (state) {
        case CycleState::Idle: return "idle";
        case CycleState::PreparingQueue: return "preparing-queue";
        case CycleState::LoadingSnapshots: return "loading-snapshots";
        case CycleState::Reconciling: return "reconciling";
        case CycleState::Submitting: return "submitting";
        case CycleState::ApplyingActions: return "applying-actions";
        case CycleState::Complete: return "complete";
        case CycleState::Failed: return "failed";
        default: return "unknown";
    }
}

bool CycleStateMachine::can_transition(CycleState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (is_terminal()) {
        return false;
    }

    return is_progressive(state_, target);
}

} // namespace dirsync::sync
