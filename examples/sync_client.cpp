#include "dirsync/core/config.hpp"
#include "dirsync/core/logging.hpp"
#include "dirsync/core/paths.hpp"
#include "dirsync/events/components.hpp"
#include "dirsync/events/event_bus.hpp"
#include "dirsync/network/http_client.hpp"
#include "dirsync/queue/rabbitmq_management.hpp"
#include "dirsync/snapshot/store.hpp"
#include "dirsync/sync/cycle.hpp"
#include "dirsync/sync/executor.hpp"
#include "dirsync/sync/protocol.hpp"
#include "dirsync/sync/transfer.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--env-file PATH] [--log-level LEVEL]\n"
              << "\n"
              << "Runs one sync cycle for the directory named by SYNC_DIRECTORY.\n"
              << "Required environment: CLIENT_ID, RABBITMQ_ADDRESS, RABBITMQ_QUEUE_NAME,\n"
              << "                      SYNC_SERVER_URL, SYNC_DIRECTORY\n";
}

} // namespace

int main(int argc, char* argv[]) {
    dirsync::init_logging("info");

    fs::path env_file = ".env";
    bool env_file_given = false;
    std::optional<std::string> log_level;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-e" || arg == "--env-file") && i + 1 < argc) {
            env_file = fs::path(argv[++i]);
            env_file_given = true;
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            spdlog::error("Unknown argument: {}", arg);
            print_usage(argv[0]);
            return 1;
        }
    }

    auto env_loaded = dirsync::ConfigLoader::load_env_file(env_file);
    if (env_loaded.is_error()) {
        if (env_file_given) {
            spdlog::error("{}", env_loaded.error());
            return 1;
        }
        spdlog::info("No environment file loaded: {}", env_loaded.error());
    } else {
        spdlog::debug("Loaded {} variable(s) from {}", env_loaded.value(), env_file.string());
    }

    auto config_result = dirsync::ConfigLoader::from_environment();
    if (config_result.is_error()) {
        spdlog::error("{}", config_result.error());
        return 1;
    }
    const dirsync::ClientConfig config = config_result.take_value();
    dirsync::init_logging(log_level.value_or(config.log_level));

    std::error_code ec;
    if (!fs::is_directory(config.sync_directory, ec)) {
        spdlog::error("SYNC_DIRECTORY is not a directory: {}", config.sync_directory.string());
        return 1;
    }

    spdlog::info("Starting sync client id={} root={}", config.client_id, config.sync_directory.string());

    dirsync::events::EventBus bus;
    dirsync::events::LoggerComponent logger(bus);
    dirsync::events::MetricsComponent metrics(bus);

    dirsync::network::BeastHttpClient http(config.http_timeout);
    dirsync::queue::RabbitMqManagementQueue queue(http, config.queue_address, config.queue_vhost);
    dirsync::PathMapper paths(config.sync_directory);
    dirsync::snapshot::FileSnapshotStore store(config.sync_directory, config.snapshot_path);
    dirsync::sync::HttpFileTransfer transfer(http, config.server_url, paths,
                                             config.sync_directory / dirsync::kMetadataDirName / "staging");
    dirsync::sync::LocalDirectoryCreator directories;
    dirsync::sync::SyncProtocolClient protocol(http, config.server_url);
    dirsync::sync::ActionExecutor executor(config.client_id, paths, transfer, directories, store, bus);

    dirsync::sync::SyncCycle cycle(dirsync::sync::CycleContext{
        config.client_id, config.queue_name, queue, store, protocol, executor, bus});

    auto result = cycle.run();
    metrics.print_stats();
    if (result.is_error()) {
        spdlog::error("Sync cycle aborted: {}", result.error());
        return 1;
    }

    const auto& report = result.value();
    if (!report.execution.snapshot_refreshed) {
        spdlog::warn("Sync completed but the snapshot baseline was not refreshed: {}",
                     report.execution.refresh_error);
    }
    return 0;
}
