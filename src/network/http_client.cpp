#include "dirsync/network/http_client.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>

namespace dirsync::network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

std::string base64_encode(const std::string& raw) {
    using namespace boost::archive::iterators;
    using Encoder = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;
    std::string encoded(Encoder(raw.begin()), Encoder(raw.end()));
    encoded.append((3 - raw.size() % 3) % 3, '=');
    return encoded;
}

std::string percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

http::verb to_verb(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return http::verb::get;
        case HttpMethod::POST: return http::verb::post;
        case HttpMethod::PUT: return http::verb::put;
        case HttpMethod::DELETE_METHOD: return http::verb::delete_;
        case HttpMethod::HEAD: return http::verb::head;
    }
    return http::verb::unknown;
}

} // namespace

Result<Url> parse_url(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(std::string("URL has no scheme: ") + text);
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    for (auto& ch : url.scheme) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (url.scheme != "http") {
        return Err<Url>(std::string("Unsupported URL scheme '") + url.scheme + "'");
    }

    std::string rest = text.substr(scheme_end + 3);
    const auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        url.target = rest.substr(path_start);
        if (url.target.front() == '?') {
            url.target.insert(url.target.begin(), '/');
        }
    }

    if (const auto at = authority.rfind('@'); at != std::string::npos) {
        const std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        const auto colon = userinfo.find(':');
        url.user = percent_decode(userinfo.substr(0, colon));
        if (colon != std::string::npos) {
            url.password = percent_decode(userinfo.substr(colon + 1));
        }
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        const std::string port_text = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (port_text.empty() || port_text.find_first_not_of("0123456789") != std::string::npos ||
            port_text.size() > 5 || std::stoul(port_text) == 0 || std::stoul(port_text) > 65535) {
            return Err<Url>(std::string("Invalid port in URL: ") + text);
        }
        url.port = static_cast<std::uint16_t>(std::stoul(port_text));
    }

    if (authority.empty()) {
        return Err<Url>(std::string("URL has no host: ") + text);
    }
    url.host = authority;
    return Ok(std::move(url));
}

std::string percent_encode(const std::string& text, bool keep_slash) {
    std::ostringstream oss;
    for (unsigned char ch : text) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~' || (keep_slash && ch == '/')) {
            oss << static_cast<char>(ch);
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(ch) << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

std::string basic_authorization(const Url& url) {
    return "Basic " + base64_encode(url.user + ":" + url.password);
}

BeastHttpClient::BeastHttpClient(std::chrono::seconds timeout)
    : timeout_(timeout) {}

Result<HttpResponse> BeastHttpClient::send(const HttpRequest& request) {
    auto parsed = parse_url(request.url);
    if (parsed.is_error()) {
        return Err<HttpResponse>(parsed.error());
    }
    const Url& url = parsed.value();

    http::request<http::string_body> req{to_verb(request.method), url.target, 11};
    req.set(http::field::host, url.port == 80 ? url.host : url.host + ":" + std::to_string(url.port));
    req.set(http::field::user_agent, "dirsync-client");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (url.has_credentials()) {
        req.set(http::field::authorization, basic_authorization(url));
    }
    req.body() = request.body;
    req.prepare_payload();

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    // Each step runs the context to completion so the stream timeout applies
    auto run = [&ioc]() {
        ioc.restart();
        ioc.run();
    };

    const auto endpoints = resolver.resolve(url.host, std::to_string(url.port), ec);
    if (ec) {
        return Err<HttpResponse>(std::string("Failed to resolve ") + url.host + ": " + ec.message());
    }

    stream.expires_after(timeout_);
    stream.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run();
    if (ec) {
        return Err<HttpResponse>(std::string("Failed to connect to ") + url.host + ": " + ec.message());
    }

    stream.expires_after(timeout_);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run();
    if (ec) {
        return Err<HttpResponse>(std::string("Failed to send request: ") + ec.message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    if (request.method == HttpMethod::HEAD) {
        parser.skip(true);
    }

    stream.expires_after(timeout_);
    http::async_read(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run();
    if (ec) {
        return Err<HttpResponse>(std::string("Failed to read response: ") + ec.message());
    }

    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
        spdlog::debug("[Http] shutdown host={} error={}", url.host, shutdown_ec.message());
    }

    auto res = parser.release();
    HttpResponse response;
    response.status_code = static_cast<int>(res.result_int());
    const auto reason = res.reason();
    response.reason_phrase.assign(reason.data(), reason.size());
    for (const auto& field : res) {
        const auto name = field.name_string();
        const auto value = field.value();
        response.headers[std::string(name.data(), name.size())] = std::string(value.data(), value.size());
    }
    response.body = std::move(res.body());

    spdlog::debug("[Http] {} {}{} status={} bytes={}", HttpMethodUtils::to_string(request.method),
                  url.host, url.target, response.status_code, response.body.size());
    return Ok(std::move(response));
}

} // namespace dirsync::network
