#pragma once

#include "dirsync/core/paths.hpp"
#include "dirsync/core/result.hpp"
#include "dirsync/network/http_client.hpp"

#include <filesystem>
#include <string>

namespace dirsync::sync {

/**
 * @brief Moves file contents between the sync root and the server
 */
class FileTransfer {
public:
    virtual ~FileTransfer() = default;

    /// Upload a local file; returns the server's URL for the stored copy
    virtual Result<std::string> upload(const std::filesystem::path& local_path, const std::string& client_id) = 0;

    /// Fetch the server's copy of a normalized path into the sync root
    virtual Result<void> download(const std::string& normalized_path) = 0;
};

/**
 * @brief Creates directories inside the sync root
 *
 * Creating a directory that already exists succeeds.
 */
class DirectoryCreator {
public:
    virtual ~DirectoryCreator() = default;
    virtual Result<void> make_directory(const std::filesystem::path& local_path) = 0;
};

class LocalDirectoryCreator : public DirectoryCreator {
public:
    Result<void> make_directory(const std::filesystem::path& local_path) override;
};

/**
 * @brief FileTransfer over the sync server's HTTP endpoints
 *
 * Upload:   POST <server>/upload, multipart fields client_id, path, file;
 *           reply {"file_url": "..."}
 * Download: GET <server>/files/<normalized path>; the body is written to a
 *           staging file first and renamed onto the destination.
 */
class HttpFileTransfer : public FileTransfer {
public:
    HttpFileTransfer(network::HttpClient& http,
                     std::string server_url,
                     PathMapper paths,
                     std::filesystem::path staging_root);

    Result<std::string> upload(const std::filesystem::path& local_path, const std::string& client_id) override;
    Result<void> download(const std::string& normalized_path) override;

private:
    static std::string make_boundary();

    static Result<void> ensure_parent_exists(const std::filesystem::path& path);

    network::HttpClient& http_;
    std::string server_url_;
    PathMapper paths_;
    std::filesystem::path staging_root_;
};

} // namespace dirsync::sync
