#pragma once

#include "dirsync/core/result.hpp"

#include <cstddef>
#include <string>

namespace dirsync::queue {

/**
 * @brief Management operations on the client's notification queue
 */
class MessageQueue {
public:
    virtual ~MessageQueue() = default;

    /// Create the queue (durable, not auto-deleted) unless it already exists
    virtual Result<void> declare_queue(const std::string& name) = 0;

    /// Drop every pending message; returns how many were dropped
    virtual Result<std::size_t> purge_queue(const std::string& name) = 0;
};

} // namespace dirsync::queue
