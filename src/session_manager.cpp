#include "session_manager.hpp"
#include "json_codec.hpp"
#include "sync_errors.hpp"

#include <spdlog/spdlog.h>

namespace {

constexpr const char* SID_HEADER = "sid";

} // namespace

http::Endpoint endpointFor(const InstanceConfig& instance) {
    return http::Endpoint{instance.schema, instance.host, instance.port};
}

Session::Session(const InstanceConfig& instance,
                 std::shared_ptr<http::Client> client,
                 std::string sid,
                 std::chrono::seconds validity)
    : m_label(instance.label()),
      m_endpoint(endpointFor(instance)),
      m_client(std::move(client)),
      m_sid(std::move(sid)),
      m_validity(validity) {}

Session::~Session() {
    release();
}

Session::Session(Session&& other) noexcept
    : m_label(std::move(other.m_label)),
      m_endpoint(std::move(other.m_endpoint)),
      m_client(std::move(other.m_client)),
      m_sid(std::move(other.m_sid)),
      m_validity(other.m_validity),
      m_released(other.m_released) {
    other.m_released = true;
}

Session& Session::operator=(Session&& other) noexcept {
    if (this != &other) {
        release();
        m_label = std::move(other.m_label);
        m_endpoint = std::move(other.m_endpoint);
        m_client = std::move(other.m_client);
        m_sid = std::move(other.m_sid);
        m_validity = other.m_validity;
        m_released = other.m_released;
        other.m_released = true;
    }
    return *this;
}

http::Response Session::send(http::Request request) const {
    if (m_released) {
        throw SyncError("[" + m_label + "] session already released");
    }
    request.headers[SID_HEADER] = m_sid;
    return m_client->send(m_endpoint, request);
}

void Session::release() noexcept {
    if (m_released) {
        return;
    }
    m_released = true;

    try {
        http::Request request;
        request.method = http::Method::DELETE;
        request.target = "/api/auth";
        request.headers[SID_HEADER] = m_sid;
        const auto response = m_client->send(m_endpoint, request);
        if (!response.ok()) {
            spdlog::warn("[{}] logout returned HTTP {}", m_label, response.status);
        } else {
            spdlog::debug("[{}] logged out", m_label);
        }
    } catch (const std::exception& e) {
        spdlog::warn("[{}] logout failed: {}", m_label, e.what());
    }
}

SessionManager::SessionManager(std::shared_ptr<http::Client> client) : m_client(std::move(client)) {}

Session SessionManager::acquire(const InstanceConfig& instance) const {
    const std::string label = instance.label();

    Json::Value credentials(Json::objectValue);
    credentials["password"] = instance.apiKey;

    http::Request request;
    request.method = http::Method::POST;
    request.target = "/api/auth";
    request.contentType = "application/json";
    request.body = json::write(credentials);

    http::Response response;
    try {
        response = m_client->send(endpointFor(instance), request);
    } catch (const TransportError& e) {
        throw AuthError("[" + label + "] login failed: " + e.what());
    }

    if (response.status == 401) {
        throw AuthError("[" + label + "] login refused: invalid app password");
    }
    if (!response.ok()) {
        throw AuthError("[" + label + "] login failed with HTTP " + std::to_string(response.status));
    }

    Json::Value body;
    try {
        body = json::parse(response.body, "[" + label + "] POST /api/auth");
    } catch (const TransportError& e) {
        throw AuthError(e.what());
    }

    if (!body.isObject() || !body["session"].isObject()) {
        throw AuthError("[" + label + "] login failed: response carries no session");
    }
    const Json::Value& session = body["session"];
    const std::string sid = session["sid"].isString() ? session["sid"].asString() : std::string();
    if (!session["valid"].isBool() || !session["valid"].asBool() || sid.empty()) {
        throw AuthError("[" + label + "] login refused: no session id received, the app password is probably invalid");
    }

    Session acquired(instance, m_client, sid,
                     std::chrono::seconds(session["validity"].isIntegral() ? session["validity"].asInt64() : 0));
    spdlog::debug("[{}] session acquired, valid for {}s", label, acquired.validity().count());
    return acquired;
}
