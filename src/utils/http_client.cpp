/**
 * @file http_client.cpp
 * @brief Boost.Beast HTTP(S) transport
 *
 * Each step (resolve, connect, TLS handshake, write, read) is issued as an
 * async operation and driven to completion on a private io_context, because
 * `beast::tcp_stream` deadlines only apply to async operations. The caller
 * still sees a blocking call bounded by the request timeout.
 *
 * @date 2025
 */

#include "sandcell/utils/http_client.hpp"
#include "sandcell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace sandcell {
namespace utils {

namespace {

// Start an async operation, run the context until it completes, rethrow errors
template <typename Initiate>
void RunToCompletion(net::io_context& ioc, const std::string& stage, Initiate&& initiate) {
    beast::error_code ec;
    initiate([&ec](const beast::error_code& result, auto&&...) { ec = result; });
    ioc.restart();
    ioc.run();
    if (ec) {
        throw HttpError(stage + " failed: " + ec.message());
    }
}

template <typename Stream>
HttpResponse Exchange(net::io_context& ioc,
                      Stream& stream,
                      http::request<http::string_body>& request) {
    RunToCompletion(ioc, "write", [&](auto handler) {
        http::async_write(stream, request, std::move(handler));
    });

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());

    RunToCompletion(ioc, "read", [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });

    auto message = parser.release();

    HttpResponse response;
    response.status = static_cast<int>(message.result_int());
    response.body = std::move(message.body());
    for (const auto& field : message) {
        auto name = field.name_string();
        auto value = field.value();
        response.headers[StringUtils::ToLower(std::string(name.data(), name.size()))] =
            std::string(value.data(), value.size());
    }
    return response;
}

http::request<http::string_body> BuildRequest(const HttpRequest& request,
                                              const ParsedUrl& url) {
    http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + request.method);
    }

    http::request<http::string_body> req{verb, url.target, 11};
    bool default_port = (url.scheme == "https" && url.port == "443") ||
                        (url.scheme == "http" && url.port == "80");
    req.set(http::field::host, default_port ? url.host : url.host + ":" + url.port);
    req.set(http::field::user_agent, "sandcell/1.0");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

BeastHttpClient::BeastHttpClient(std::chrono::seconds default_timeout)
    : default_timeout_(default_timeout) {}

// ============================================================================
// REQUEST EXECUTION
// ============================================================================

HttpResponse BeastHttpClient::Send(const HttpRequest& request) {
    ParsedUrl url = ParseUrl(request.url);
    auto timeout = request.timeout.value_or(default_timeout_);
    auto req = BuildRequest(request, url);

    spdlog::debug("HTTP {} {}://{}{}", request.method, url.scheme, url.host, url.target);

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    tcp::resolver::results_type endpoints;

    RunToCompletion(ioc, "resolve " + url.host, [&](auto handler) {
        resolver.async_resolve(url.host, url.port,
            [&endpoints, handler](const beast::error_code& ec,
                                  tcp::resolver::results_type results) mutable {
                endpoints = std::move(results);
                handler(ec);
            });
    });

    if (url.scheme == "http") {
        beast::tcp_stream stream(ioc);
        stream.expires_after(timeout);

        RunToCompletion(ioc, "connect", [&](auto handler) {
            stream.async_connect(endpoints, std::move(handler));
        });

        auto response = Exchange(ioc, stream, req);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    ssl::context ctx(ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_options(ssl::context::default_workarounds);
    ctx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    beast::get_lowest_layer(stream).expires_after(timeout);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category()};
        throw HttpError("SNI setup failed: " + ec.message());
    }
    stream.set_verify_callback(ssl::host_name_verification(url.host));

    RunToCompletion(ioc, "connect", [&](auto handler) {
        beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
    });
    RunToCompletion(ioc, "tls_handshake", [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });

    auto response = Exchange(ioc, stream, req);

    // Peers commonly drop the connection without close_notify; not an error for us
    beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
    beast::error_code ec;
    stream.async_shutdown([&ec](const beast::error_code& result) { ec = result; });
    ioc.restart();
    ioc.run();
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        spdlog::debug("TLS shutdown: {}", ec.message());
    }

    return response;
}

// ============================================================================
// URL HELPERS
// ============================================================================

ParsedUrl BeastHttpClient::ParseUrl(const std::string& url) {
    ParsedUrl parsed;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw HttpError("URL has no scheme: " + url);
    }
    parsed.scheme = StringUtils::ToLower(url.substr(0, scheme_end));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw HttpError("Unsupported URL scheme: " + parsed.scheme);
    }

    auto authority_begin = scheme_end + 3;
    auto path_begin = url.find_first_of("/?", authority_begin);
    std::string authority = url.substr(authority_begin,
        path_begin == std::string::npos ? std::string::npos : path_begin - authority_begin);
    if (authority.empty()) {
        throw HttpError("URL has no host: " + url);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    } else {
        parsed.host = authority;
        parsed.port = parsed.scheme == "https" ? "443" : "80";
    }

    if (path_begin != std::string::npos) {
        parsed.target = url.substr(path_begin);
        if (parsed.target[0] == '?') {
            parsed.target = "/" + parsed.target;
        }
    }

    return parsed;
}

std::string BeastHttpClient::UrlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }

    return oss.str();
}

} // namespace utils
} // namespace sandcell
