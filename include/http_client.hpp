#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace http {

enum class Method {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE
};

const char* methodName(Method method);

/// Where a request goes. Scheme is "http" or "https".
struct Endpoint {
    std::string scheme;
    std::string host;
    uint16_t port;
};

struct Request {
    Method method = Method::GET;
    std::string target;                        // path and query, e.g. "/api/config"
    std::map<std::string, std::string> headers;
    std::string body;
    std::string contentType;
};

struct Response {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/// One request/response exchange. Implementations throw TransportError when
/// no response could be obtained (resolve, connect, TLS, timeout).
class Client {
public:
    virtual ~Client() = default;

    virtual Response send(const Endpoint& endpoint, const Request& request) = 0;
};

/// Boost.Beast backed client. Every step of the exchange is bounded by the
/// configured timeout. Certificates are not verified: Pi-hole ships a
/// self-signed one.
class BeastClient : public Client {
public:
    explicit BeastClient(std::chrono::seconds timeout = std::chrono::seconds(30));

    Response send(const Endpoint& endpoint, const Request& request) override;

private:
    std::chrono::seconds m_timeout;
};

/// Percent-encodes everything except unreserved characters (RFC 3986)
std::string urlEncode(const std::string& value);

} // namespace http

#endif // HTTP_CLIENT_HPP
