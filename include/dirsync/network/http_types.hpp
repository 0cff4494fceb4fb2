#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace dirsync {
namespace network {

/**
 * @brief HTTP request methods the client issues
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // Renamed to avoid the Windows DELETE macro
    HEAD
};

/**
 * @brief Outgoing HTTP request
 *
 * url is absolute ("http://host:port/path?query"). Headers are sent as
 * given; Host and Content-Length are filled in by the client.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }
};

/**
 * @brief Response received from a server
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    std::map<std::string, std::string> headers;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief Components of an http:// URL
 */
struct Url {
    std::string scheme;
    std::string user;
    std::string password;
    std::string host;
    std::uint16_t port = 80;
    std::string target = "/";   // Path plus query, always starts with '/'

    bool has_credentials() const { return !user.empty(); }
};

class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
        }
        return "";
    }
};

} // namespace network
} // namespace dirsync
