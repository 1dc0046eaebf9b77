#include "http_client.hpp"
#include "sync_errors.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace http {

namespace {

constexpr const char* USER_AGENT = "pihole-sync/1.0";

// Teleporter archives can be several megabytes; Beast defaults to 8 MiB.
constexpr std::uint64_t RESPONSE_BODY_LIMIT = 256ull * 1024 * 1024;

beast::http::verb toVerb(Method method) {
    switch (method) {
        case Method::GET: return beast::http::verb::get;
        case Method::POST: return beast::http::verb::post;
        case Method::PUT: return beast::http::verb::put;
        case Method::PATCH: return beast::http::verb::patch;
        case Method::DELETE: return beast::http::verb::delete_;
    }
    return beast::http::verb::get;
}

template <class Handler>
void asyncHandshake(beast::tcp_stream&, const std::string&, Handler&& handler) {
    handler(beast::error_code{});
}

template <class Handler>
void asyncHandshake(beast::ssl_stream<beast::tcp_stream>& stream, const std::string& host, Handler&& handler) {
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        handler(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
        return;
    }
    stream.async_handshake(ssl::stream_base::client, std::forward<Handler>(handler));
}

void closeStream(beast::tcp_stream& stream) {
    beast::error_code ec;
    // not_connected happens when the peer already closed; nothing to report
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
}

void closeStream(beast::ssl_stream<beast::tcp_stream>& stream) {
    beast::get_lowest_layer(stream).close();
}

// Runs resolve, connect, handshake, write and read as one async chain so that
// every step honours the stream timeout.
template <class Stream>
Response exchange(net::io_context& ioc,
                  Stream& stream,
                  const Endpoint& endpoint,
                  beast::http::request<beast::http::string_body>& message,
                  std::chrono::seconds timeout) {
    tcp::resolver resolver(ioc);
    beast::flat_buffer buffer;
    beast::http::response_parser<beast::http::string_body> parser;
    parser.body_limit(RESPONSE_BODY_LIMIT);

    beast::error_code failure;
    const char* failedStep = nullptr;
    auto& lowest = beast::get_lowest_layer(stream);

    auto fail = [&](const char* step, beast::error_code ec) {
        failedStep = step;
        failure = ec;
    };

    resolver.async_resolve(endpoint.host, std::to_string(endpoint.port),
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) return fail("resolve", ec);
            lowest.expires_after(timeout);
            lowest.async_connect(results, [&](beast::error_code ec, const tcp::endpoint&) {
                if (ec) return fail("connect", ec);
                lowest.expires_after(timeout);
                asyncHandshake(stream, endpoint.host, [&](beast::error_code ec) {
                    if (ec) return fail("tls handshake", ec);
                    lowest.expires_after(timeout);
                    beast::http::async_write(stream, message, [&](beast::error_code ec, std::size_t) {
                        if (ec) return fail("write", ec);
                        lowest.expires_after(timeout);
                        beast::http::async_read(stream, buffer, parser, [&](beast::error_code ec, std::size_t) {
                            if (ec) return fail("read", ec);
                        });
                    });
                });
            });
        });

    // The resolver has no timeout of its own; bound the whole exchange.
    ioc.run_for(timeout * 4);
    if (!ioc.stopped()) {
        ioc.stop();
        failedStep = "exchange";
        failure = beast::error::timeout;
    }

    if (failedStep != nullptr) {
        auto verb = message.method_string();
        auto target = message.target();
        throw TransportError(std::string(verb.data(), verb.size()) + " " +
                             std::string(target.data(), target.size()) +
                             " on " + endpoint.host + ":" + std::to_string(endpoint.port) +
                             " failed during " + failedStep + ": " + failure.message());
    }

    closeStream(stream);

    auto result = parser.release();
    Response response;
    response.status = static_cast<int>(result.result_int());
    response.body = std::move(result.body());
    return response;
}

} // namespace

const char* methodName(Method method) {
    switch (method) {
        case Method::GET: return "GET";
        case Method::POST: return "POST";
        case Method::PUT: return "PUT";
        case Method::PATCH: return "PATCH";
        case Method::DELETE: return "DELETE";
    }
    return "GET";
}

BeastClient::BeastClient(std::chrono::seconds timeout) : m_timeout(timeout) {}

Response BeastClient::send(const Endpoint& endpoint, const Request& request) {
    beast::http::request<beast::http::string_body> message{toVerb(request.method), request.target, 11};
    message.set(beast::http::field::host, endpoint.host);
    message.set(beast::http::field::user_agent, USER_AGENT);
    message.set(beast::http::field::accept, "application/json");
    for (const auto& [name, value] : request.headers) {
        message.set(name, value);
    }
    if (!request.contentType.empty()) {
        message.set(beast::http::field::content_type, request.contentType);
    }
    message.body() = request.body;
    message.prepare_payload();

    net::io_context ioc;

    if (endpoint.scheme == "https") {
        ssl::context context(ssl::context::tls_client);
        context.set_verify_mode(ssl::verify_none);
        beast::ssl_stream<beast::tcp_stream> stream(ioc, context);
        return exchange(ioc, stream, endpoint, message, m_timeout);
    }

    beast::tcp_stream stream(ioc);
    return exchange(ioc, stream, endpoint, message, m_timeout);
}

std::string urlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

} // namespace http
