#include "dirsync/sync/transfer.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace dirsync::sync {
namespace fs = std::filesystem;
using json = nlohmann::json;

Result<void> LocalDirectoryCreator::make_directory(const fs::path& local_path) {
    std::error_code ec;
    fs::create_directories(local_path, ec);
    std::error_code check_ec;
    if (fs::is_directory(local_path, check_ec)) {
        return Ok();
    }
    if (ec) {
        return Err<void>(std::string("Failed to create directory ") + local_path.string() + ": " + ec.message());
    }
    return Err<void>(std::string("Path exists and is not a directory: ") + local_path.string());
}

HttpFileTransfer::HttpFileTransfer(network::HttpClient& http,
                                   std::string server_url,
                                   PathMapper paths,
                                   fs::path staging_root)
    : http_(http),
      server_url_(std::move(server_url)),
      paths_(std::move(paths)),
      staging_root_(std::move(staging_root)) {
    while (!server_url_.empty() && server_url_.back() == '/') {
        server_url_.pop_back();
    }
}

Result<std::string> HttpFileTransfer::upload(const fs::path& local_path, const std::string& client_id) {
    auto normalized = paths_.to_normalized(local_path);
    if (normalized.is_error()) {
        return Err<std::string>(normalized.error());
    }

    std::ifstream input(local_path, std::ios::binary);
    if (!input) {
        return Err<std::string>(std::string("Failed to open source file: ") + local_path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    if (input.bad()) {
        return Err<std::string>(std::string("Failed to read source file: ") + local_path.string());
    }

    const std::string boundary = make_boundary();
    std::ostringstream body;
    body << "--" << boundary << "\r\n"
         << "Content-Disposition: form-data; name=\"client_id\"\r\n\r\n"
         << client_id << "\r\n"
         << "--" << boundary << "\r\n"
         << "Content-Disposition: form-data; name=\"path\"\r\n\r\n"
         << normalized.value() << "\r\n"
         << "--" << boundary << "\r\n"
         << "Content-Disposition: form-data; name=\"file\"; filename=\""
         << local_path.filename().string() << "\"\r\n"
         << "Content-Type: application/octet-stream\r\n\r\n"
         << contents.str() << "\r\n"
         << "--" << boundary << "--\r\n";

    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.url = server_url_ + "/upload";
    request.set_header("Content-Type", "multipart/form-data; boundary=" + boundary);
    request.body = body.str();

    auto response = http_.send(request);
    if (response.is_error()) {
        return Err<std::string>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<std::string>(std::string("Upload rejected: HTTP ") + std::to_string(response.value().status_code));
    }

    auto reply = json::parse(response.value().body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        return Err<std::string>(std::string("Upload response is not a JSON object"));
    }
    const auto url_it = reply.find("file_url");
    if (url_it == reply.end() || !url_it->is_string() || url_it->get<std::string>().empty()) {
        return Err<std::string>(std::string("Upload response has no file_url"));
    }
    return Ok(url_it->get<std::string>());
}

Result<void> HttpFileTransfer::download(const std::string& normalized_path) {
    auto destination = paths_.to_local(normalized_path);
    if (destination.is_error()) {
        return Err<void>(destination.error());
    }
    auto canonical = PathMapper::normalize(normalized_path);
    if (canonical.is_error()) {
        return Err<void>(canonical.error());
    }

    network::HttpRequest request;
    request.method = network::HttpMethod::GET;
    request.url = server_url_ + "/files/" + network::percent_encode(canonical.value(), true);

    auto response = http_.send(request);
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<void>(std::string("Download rejected: HTTP ") + std::to_string(response.value().status_code));
    }

    const fs::path staging_path = staging_root_ / fs::path(canonical.value());
    if (auto res = ensure_parent_exists(staging_path); res.is_error()) {
        return res;
    }

    {
        std::ofstream output(staging_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(std::string("Failed to create staging file: ") + staging_path.string());
        }
        const auto& data = response.value().body;
        output.write(data.data(), static_cast<std::streamsize>(data.size()));
        output.flush();
        if (!output) {
            return Err<void>(std::string("Failed to write staging file: ") + staging_path.string());
        }
    }

    if (auto res = ensure_parent_exists(destination.value()); res.is_error()) {
        return res;
    }

    std::error_code ec;
    fs::rename(staging_path, destination.value(), ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(staging_path, cleanup_ec);
        return Err<void>(std::string("Failed to move downloaded file into place: ") +
                         destination.value().string() + ": " + ec.message());
    }

    spdlog::debug("[Transfer] downloaded path={} bytes={}", canonical.value(), response.value().body.size());
    return Ok();
}

std::string HttpFileTransfer::make_boundary() {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::ostringstream oss;
    oss << "dirsync-" << std::hex << std::setw(16) << std::setfill('0') << engine();
    return oss.str();
}

Result<void> HttpFileTransfer::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    std::error_code check_ec;
    if (ec && !fs::is_directory(parent, check_ec)) {
        return Err<void>(std::string("Failed to create directory: ") + parent.string());
    }
    return Ok();
}

} // namespace dirsync::sync
