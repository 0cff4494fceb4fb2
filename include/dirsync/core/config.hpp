#pragma once

#include "dirsync/core/result.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace dirsync {

/**
 * @brief Settings for one sync client, resolved once at startup
 *
 * Every component receives the values it needs from this struct; nothing
 * reads the process environment after startup.
 */
struct ClientConfig {
    std::string client_id;
    std::string queue_address;          ///< RabbitMQ management API base URL
    std::string queue_name;
    std::string queue_vhost = "/";
    std::string server_url;             ///< Sync server base URL, no trailing slash
    std::filesystem::path sync_directory;
    std::filesystem::path snapshot_path;
    std::chrono::seconds http_timeout{30};
    std::string log_level = "info";
};

/// Looks a variable up by name; empty optional when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

class ConfigLoader {
public:
    /**
     * @brief Build a config from an arbitrary variable source
     *
     * Fails listing every missing required variable, or on the first
     * optional variable that does not parse.
     */
    static Result<ClientConfig> from_lookup(const EnvLookup& lookup);

    /// Build a config from the process environment
    static Result<ClientConfig> from_environment();

    /**
     * @brief Load KEY=VALUE pairs from a dotenv file into the environment
     *
     * Variables already present in the environment are left alone.
     * Returns the number of variables set.
     */
    static Result<std::size_t> load_env_file(const std::filesystem::path& path);

    /// Parse one dotenv line; empty optional for blanks and comments
    static std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string& line);
};

} // namespace dirsync
