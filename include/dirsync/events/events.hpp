/**
 * @file events.hpp
 * @brief Events published during a sync cycle
 *
 * NAMING CONVENTION:
 * - Events are past-tense and describe something that already happened
 * - Every event carries the time it was created
 */

#pragma once

#include "dirsync/snapshot/types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace dirsync::events {

using Clock = std::chrono::system_clock;

// ════════════════════════════════════════════════════════
// Cycle stage events
// ════════════════════════════════════════════════════════

/**
 * @brief The notification queue exists and has been emptied
 */
struct QueuePreparedEvent {
    std::string queue_name;
    std::size_t purged_messages = 0;
    Clock::time_point timestamp = Clock::now();
};

/**
 * @brief A snapshot was accepted by the sync server
 */
struct SnapshotSubmittedEvent {
    std::string client_id;
    std::size_t entries = 0;
    std::size_t tombstones = 0;
    bool first_run = false;          ///< No previous baseline existed
    std::size_t planned_actions = 0;
    Clock::time_point timestamp = Clock::now();
};

/**
 * @brief The post-sync snapshot was captured and persisted
 */
struct SnapshotRefreshedEvent {
    std::size_t entries = 0;
    Clock::time_point timestamp = Clock::now();
};

/**
 * @brief Capturing or persisting the post-sync snapshot failed
 */
struct SnapshotRefreshFailedEvent {
    std::string error;
    Clock::time_point timestamp = Clock::now();
};

// ════════════════════════════════════════════════════════
// Per-directive events
// ════════════════════════════════════════════════════════

struct ActionCompletedEvent {
    std::string path;
    snapshot::FileAction action = snapshot::FileAction::Unknown;
    std::string detail;              ///< Remote URL for uploads, empty otherwise
    Clock::time_point timestamp = Clock::now();
};

struct ActionFailedEvent {
    std::string path;
    snapshot::FileAction action = snapshot::FileAction::Unknown;
    std::string error;
    Clock::time_point timestamp = Clock::now();
};

/**
 * @brief The plan contained an action this client does not understand
 */
struct UnknownActionEvent {
    std::string path;
    std::string raw_action;
    Clock::time_point timestamp = Clock::now();
};

// ════════════════════════════════════════════════════════
// Cycle outcome events
// ════════════════════════════════════════════════════════

struct CycleCompletedEvent {
    std::string client_id;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::chrono::milliseconds duration{0};
    Clock::time_point timestamp = Clock::now();
};

struct CycleFailedEvent {
    std::string client_id;
    std::string stage;
    std::string error;
    Clock::time_point timestamp = Clock::now();
};

} // namespace dirsync::events
