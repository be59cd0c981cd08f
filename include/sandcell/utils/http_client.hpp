/**
 * @file http_client.hpp
 * @brief Minimal synchronous HTTP(S) client for the remote sandbox provider
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace sandcell {
namespace utils {

/**
 * @struct HttpRequest
 * @brief One request; `url` is absolute (`https://host[:port]/path?query`)
 */
struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::optional<std::chrono::seconds> timeout;
};

/**
 * @struct HttpResponse
 * @brief Status, headers and complete body of a response
 */
struct HttpResponse {
    int status{0};
    std::map<std::string, std::string> headers;
    std::string body;

    bool Ok() const { return status >= 200 && status < 300; }
};

/**
 * @class HttpError
 * @brief The request could not be delivered or the response not read
 */
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct ParsedUrl
 * @brief Components of an absolute URL
 */
struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target{"/"};
};

/**
 * @class HttpClient
 * @brief Request/response transport
 *
 * Non-2xx statuses are returned, not thrown. Implementations must be safe
 * to call from several threads at once.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @throws HttpError on connection, TLS or protocol failure
     */
    virtual HttpResponse Send(const HttpRequest& request) = 0;
};

/**
 * @class BeastHttpClient
 * @brief Boost.Beast implementation (TLS via Boost.Asio + OpenSSL)
 *
 * Opens one connection per request; the provider's calls are infrequent
 * and long-running, so pooling buys nothing.
 */
class BeastHttpClient : public HttpClient {
public:
    explicit BeastHttpClient(std::chrono::seconds default_timeout = std::chrono::seconds(60));

    HttpResponse Send(const HttpRequest& request) override;

    /**
     * @throws HttpError on an unsupported or malformed URL
     */
    static ParsedUrl ParseUrl(const std::string& url);

    /**
     * @brief Percent-encode a query parameter value
     */
    static std::string UrlEncode(const std::string& value);

private:
    std::chrono::seconds default_timeout_;
};

} // namespace utils
} // namespace sandcell
