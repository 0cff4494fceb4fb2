#pragma once

#include "dirsync/core/result.hpp"
#include "dirsync/queue/message_queue.hpp"

#include <cstddef>
#include <string>

namespace dirsync::queue {

/**
 * @brief Gives each sync cycle a clean notification channel
 *
 * Declares the client's queue and empties it. Messages queued while the
 * client was offline are dropped: the snapshot reconciliation that follows
 * is authoritative for the cycle. Either step failing is fatal.
 */
class QueueBootstrap {
public:
    explicit QueueBootstrap(MessageQueue& queue) : queue_(queue) {}

    /// @return number of purged messages
    Result<std::size_t> prepare(const std::string& queue_name);

private:
    MessageQueue& queue_;
};

} // namespace dirsync::queue
