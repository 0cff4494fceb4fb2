#pragma once

#include <string>

namespace dirsync {

/**
 * @brief Configure the default spdlog logger for the client
 *
 * Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
 * "critical", "off"). Unknown names fall back to info.
 *
 * @return false when the level name was not recognised
 */
bool init_logging(const std::string& level);

} // namespace dirsync
