#include "dirsync/core/config.hpp"
#include "dirsync/core/paths.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace dirsync {
namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

Result<ClientConfig> ConfigLoader::from_lookup(const EnvLookup& lookup) {
    static const std::array<const char*, 5> required = {
        "CLIENT_ID", "RABBITMQ_ADDRESS", "RABBITMQ_QUEUE_NAME", "SYNC_SERVER_URL", "SYNC_DIRECTORY"
    };

    std::vector<std::string> missing;
    auto get = [&](const char* name) -> std::string {
        auto value = lookup(name);
        if (!value || trim(*value).empty()) {
            missing.emplace_back(name);
            return {};
        }
        return trim(*value);
    };

    ClientConfig config;
    std::array<std::string, required.size()> values;
    for (std::size_t i = 0; i < required.size(); ++i) {
        values[i] = get(required[i]);
    }

    if (!missing.empty()) {
        std::ostringstream oss;
        oss << "Missing required configuration:";
        for (const auto& name : missing) {
            oss << " " << name;
        }
        return Err<ClientConfig>(oss.str());
    }

    config.client_id = values[0];
    config.queue_address = strip_trailing_slashes(values[1]);
    config.queue_name = values[2];
    config.server_url = strip_trailing_slashes(values[3]);
    config.sync_directory = fs::path(values[4]).lexically_normal();

    if (!starts_with(config.server_url, "http://")) {
        return Err<ClientConfig>(std::string("SYNC_SERVER_URL must be an http:// URL: ") + config.server_url);
    }
    if (!starts_with(config.queue_address, "http://")) {
        return Err<ClientConfig>(
            std::string("RABBITMQ_ADDRESS must be the http:// URL of the RabbitMQ management API: ") +
            config.queue_address);
    }

    if (auto vhost = lookup("RABBITMQ_VHOST"); vhost && !trim(*vhost).empty()) {
        config.queue_vhost = trim(*vhost);
    }

    if (auto snapshot = lookup("SNAPSHOT_PATH"); snapshot && !trim(*snapshot).empty()) {
        config.snapshot_path = fs::path(trim(*snapshot));
    } else {
        config.snapshot_path = config.sync_directory / kMetadataDirName / "snapshot.json";
    }

    if (auto timeout = lookup("HTTP_TIMEOUT_SECONDS"); timeout && !trim(*timeout).empty()) {
        const std::string text = trim(*timeout);
        long seconds = 0;
        try {
            std::size_t consumed = 0;
            seconds = std::stol(text, &consumed);
            if (consumed != text.size()) {
                seconds = 0;
            }
        } catch (const std::exception&) {
            seconds = 0;
        }
        if (seconds <= 0) {
            return Err<ClientConfig>(std::string("HTTP_TIMEOUT_SECONDS must be a positive integer: ") + text);
        }
        config.http_timeout = std::chrono::seconds(seconds);
    }

    if (auto level = lookup("LOG_LEVEL"); level && !trim(*level).empty()) {
        config.log_level = trim(*level);
    }

    return Ok(std::move(config));
}

Result<ClientConfig> ConfigLoader::from_environment() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

Result<std::size_t> ConfigLoader::load_env_file(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<std::size_t>(std::string("Failed to open env file: ") + path.string());
    }

    std::size_t applied = 0;
    std::string line;
    while (std::getline(input, line)) {
        auto entry = parse_env_line(line);
        if (!entry) {
            continue;
        }
        if (std::getenv(entry->first.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(entry->first.c_str(), entry->second.c_str(), 0) != 0) {
            return Err<std::size_t>(std::string("Failed to set variable: ") + entry->first);
        }
        ++applied;
    }
    return Ok(applied);
}

std::optional<std::pair<std::string, std::string>> ConfigLoader::parse_env_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }
    if (starts_with(line, "export ")) {
        line = trim(line.substr(7));
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
        return std::nullopt;
    }

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));

    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    } else if (const auto hash = value.find(" #"); hash != std::string::npos) {
        value = trim(value.substr(0, hash));
    }

    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), std::move(value));
}

} // namespace dirsync
