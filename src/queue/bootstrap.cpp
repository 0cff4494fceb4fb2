#include "dirsync/queue/bootstrap.hpp"

#include <spdlog/spdlog.h>

namespace dirsync::queue {

Result<std::size_t> QueueBootstrap::prepare(const std::string& queue_name) {
    if (queue_name.empty()) {
        return Err<std::size_t>(std::string("Queue name is empty"));
    }

    if (auto declared = queue_.declare_queue(queue_name); declared.is_error()) {
        return Err<std::size_t>(declared.error());
    }
    spdlog::debug("[Queue] declared queue={}", queue_name);

    return queue_.purge_queue(queue_name);
}

} // namespace dirsync::queue
