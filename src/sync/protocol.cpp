#include "dirsync/sync/protocol.hpp"
#include "dirsync/snapshot/codec.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dirsync::sync {
using json = nlohmann::json;
using PlanResult = Result<std::optional<snapshot::SyncActionPlan>>;

SyncProtocolClient::SyncProtocolClient(network::HttpClient& http, std::string server_url)
    : http_(http) {
    while (!server_url.empty() && server_url.back() == '/') {
        server_url.pop_back();
    }
    endpoint_ = server_url + "/snapshot";
}

Result<std::string> SyncProtocolClient::encode_request(const std::string& client_id,
                                                       const snapshot::DirectorySnapshot& snapshot) {
    json payload;
    payload["client_id"] = client_id;
    payload["final_snapshot"] = snapshot::snapshot_to_json(snapshot);
    try {
        return Ok(payload.dump());
    } catch (const json::exception& e) {
        return Err<std::string>(std::string("Failed to serialize snapshot: ") + e.what());
    }
}

PlanResult SyncProtocolClient::decode_response(const std::string& body) {
    auto document = json::parse(body, nullptr, false);
    if (document.is_discarded()) {
        return Err<std::optional<snapshot::SyncActionPlan>>(std::string("Response is not valid JSON"));
    }
    if (!document.is_object()) {
        return Err<std::optional<snapshot::SyncActionPlan>>(std::string("Response is not a JSON object"));
    }

    const auto it = document.find("sync_action_metadata");
    if (it == document.end() || it->is_null()) {
        return Ok(std::optional<snapshot::SyncActionPlan>{});
    }

    auto plan = snapshot::plan_from_json(*it);
    if (plan.is_error()) {
        return Err<std::optional<snapshot::SyncActionPlan>>(std::string("Malformed action plan: ") + plan.error());
    }
    return Ok(std::optional<snapshot::SyncActionPlan>(plan.take_value()));
}

PlanResult SyncProtocolClient::submit_snapshot(const std::string& client_id,
                                               const snapshot::DirectorySnapshot& snapshot) {
    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.url = endpoint_;
    request.set_header("Content-Type", "application/json");
    auto body = encode_request(client_id, snapshot);
    if (body.is_error()) {
        return Err<std::optional<snapshot::SyncActionPlan>>(body.error());
    }
    request.body = body.take_value();

    spdlog::debug("[Protocol] POST {} entries={} bytes={}", endpoint_, snapshot.size(), request.body.size());

    auto response = http_.send(request);
    if (response.is_error()) {
        return Err<std::optional<snapshot::SyncActionPlan>>(std::string("Snapshot submission failed: ") +
                                                            response.error());
    }

    const auto& reply = response.value();
    if (!reply.is_success()) {
        return Err<std::optional<snapshot::SyncActionPlan>>(
            std::string("Snapshot submission rejected: HTTP ") + std::to_string(reply.status_code) +
            (reply.body.empty() ? std::string() : ": " + reply.body.substr(0, 256)));
    }

    return decode_response(reply.body);
}

} // namespace dirsync::sync
