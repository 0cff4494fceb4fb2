#include "dirsync/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace dirsync {

bool init_logging(const std::string& level) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only "off" itself may mean off
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}', using info", level);
        return false;
    }

    spdlog::set_level(parsed);
    return true;
}

} // namespace dirsync
