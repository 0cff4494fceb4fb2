#pragma once

#include "dirsync/core/result.hpp"

#include <chrono>
#include <string>

namespace dirsync::sync {

enum class CycleState {
    Idle,
    PreparingQueue,
    LoadingSnapshots,
    Reconciling,
    Submitting,
    ApplyingActions,
    Complete,
    Failed
};

/**
 * @brief Tracks which stage a sync cycle is in
 *
 * Stages only move forward. Reconciling is skipped on a first run.
 * Failed is reachable from every non-terminal state; Complete and Failed
 * are terminal.
 */
class CycleStateMachine {
public:
    CycleStateMachine();

    [[nodiscard]] CycleState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return state_ == CycleState::Complete || state_ == CycleState::Failed;
    }

    dirsync::Result<void> transition_to(CycleState next_state);
    dirsync::Result<void> mark_failed(std::string error_message);

    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

    static std::string to_string(CycleState state);

private:
    [[nodiscard]] bool can_transition(CycleState target) const noexcept;

    CycleState state_ = CycleState::Idle;
    std::string last_error_;
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace dirsync::sync
