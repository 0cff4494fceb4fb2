#pragma once

#include "dirsync/core/result.hpp"
#include "dirsync/network/http_types.hpp"

#include <chrono>
#include <string>

namespace dirsync::network {

/**
 * @brief Parse "http://[user[:password]@]host[:port][/path][?query]"
 *
 * Only the http scheme is accepted.
 */
Result<Url> parse_url(const std::string& url);

/// Percent-encode every byte outside RFC 3986 unreserved (and '/' if keep_slash)
std::string percent_encode(const std::string& text, bool keep_slash = false);

/// "Basic <base64(user:password)>" for the URL's user-info
std::string basic_authorization(const Url& url);

/**
 * @brief Blocking request/response transport
 *
 * Transport failures (resolve, connect, timeout, malformed response) are
 * reported as errors. Any HTTP status, including 4xx/5xx, is a successful
 * send; callers decide what a status means.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief HttpClient over Boost.Beast, one connection per request
 */
class BeastHttpClient : public HttpClient {
public:
    explicit BeastHttpClient(std::chrono::seconds timeout = std::chrono::seconds(30));

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    std::chrono::seconds timeout_;
};

} // namespace dirsync::network
