#include "dirsync/queue/rabbitmq_management.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace dirsync::queue {
using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;

namespace {

std::string describe_failure(const network::HttpResponse& response) {
    std::string message = "HTTP " + std::to_string(response.status_code);
    if (!response.reason_phrase.empty()) {
        message += " " + response.reason_phrase;
    }
    if (!response.body.empty()) {
        message += ": " + response.body.substr(0, 256);
    }
    return message;
}

} // namespace

RabbitMqManagementQueue::RabbitMqManagementQueue(network::HttpClient& http, std::string base_url, std::string vhost)
    : http_(http), base_url_(std::move(base_url)), vhost_(std::move(vhost)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

Result<void> RabbitMqManagementQueue::declare_queue(const std::string& name) {
    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = queue_url(name);
    request.set_header("Content-Type", "application/json");
    request.body = json{{"durable", true}, {"auto_delete", false}, {"arguments", json::object()}}.dump();

    auto response = http_.send(request);
    if (response.is_error()) {
        return Err<void>(std::string("Failed to declare queue ") + name + ": " + response.error());
    }
    if (!response.value().is_success()) {
        return Err<void>(std::string("Failed to declare queue ") + name + ": " + describe_failure(response.value()));
    }
    return Ok();
}

Result<std::size_t> RabbitMqManagementQueue::message_count(const std::string& name) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = queue_url(name);

    auto response = http_.send(request);
    if (response.is_error()) {
        return Err<std::size_t>(std::string("Failed to inspect queue ") + name + ": " + response.error());
    }
    if (!response.value().is_success()) {
        return Err<std::size_t>(std::string("Failed to inspect queue ") + name + ": " +
                                describe_failure(response.value()));
    }

    auto body = json::parse(response.value().body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<std::size_t>(std::string("Queue description for ") + name + " is not a JSON object");
    }

    // Freshly declared queues have no statistics until the broker samples them
    const auto it = body.find("messages");
    if (it == body.end() || it->is_null()) {
        return Ok<std::size_t>(0);
    }
    const bool non_negative = it->is_number_unsigned() ||
                              (it->is_number_integer() && it->get<std::int64_t>() >= 0);
    if (!non_negative) {
        return Err<std::size_t>(std::string("Queue message count for ") + name + " is not a non-negative integer");
    }
    return Ok(it->get<std::size_t>());
}

Result<std::size_t> RabbitMqManagementQueue::purge_queue(const std::string& name) {
    auto count = message_count(name);
    if (count.is_error()) {
        return count;
    }

    HttpRequest request;
    request.method = HttpMethod::DELETE_METHOD;
    request.url = queue_url(name) + "/contents";

    auto response = http_.send(request);
    if (response.is_error()) {
        return Err<std::size_t>(std::string("Failed to purge queue ") + name + ": " + response.error());
    }
    if (!response.value().is_success()) {
        return Err<std::size_t>(std::string("Failed to purge queue ") + name + ": " +
                                describe_failure(response.value()));
    }
    return count;
}

std::string RabbitMqManagementQueue::queue_url(const std::string& name) const {
    return base_url_ + "/api/queues/" + network::percent_encode(vhost_) + "/" + network::percent_encode(name);
}

} // namespace dirsync::queue
