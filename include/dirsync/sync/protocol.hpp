#pragma once

#include "dirsync/core/result.hpp"
#include "dirsync/network/http_client.hpp"
#include "dirsync/snapshot/types.hpp"

#include <optional>
#include <string>

namespace dirsync::sync {

/**
 * @brief Submits snapshots to the sync server and decodes its action plan
 *
 * Request:  POST <server>/snapshot {"client_id": ..., "final_snapshot": {...}}
 * Response: {"sync_action_metadata": {"files": {...}} | null}
 *
 * A missing or null plan means the directory is already in sync. Transport
 * errors, non-2xx statuses and undecodable bodies are errors.
 */
class SyncProtocolClient {
public:
    SyncProtocolClient(network::HttpClient& http, std::string server_url);

    Result<std::optional<snapshot::SyncActionPlan>> submit_snapshot(const std::string& client_id,
                                                                    const snapshot::DirectorySnapshot& snapshot);

    /// Serialized request body; fails when a path cannot be encoded as JSON
    static Result<std::string> encode_request(const std::string& client_id, const snapshot::DirectorySnapshot& snapshot);

    /// Decode a response body into an optional plan
    static Result<std::optional<snapshot::SyncActionPlan>> decode_response(const std::string& body);

private:
    network::HttpClient& http_;
    std::string endpoint_;
};

} // namespace dirsync::sync
