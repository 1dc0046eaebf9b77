#ifndef SESSION_MANAGER_HPP
#define SESSION_MANAGER_HPP

#include <chrono>
#include <memory>
#include <string>

#include "configuration.hpp"
#include "http_client.hpp"

http::Endpoint endpointFor(const InstanceConfig& instance);

/// Authenticated session against one Pi-hole instance.
///
/// Move-only. The sid is released with `DELETE /api/auth` when the session is
/// destroyed or when release() is called, whichever happens first.
class Session {
public:
    Session(const InstanceConfig& instance,
            std::shared_ptr<http::Client> client,
            std::string sid,
            std::chrono::seconds validity);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&& other) noexcept;
    Session& operator=(Session&& other) noexcept;

    /// host:port of the instance this session belongs to
    const std::string& label() const { return m_label; }
    const std::string& token() const { return m_sid; }
    /// validity window reported by the instance at login
    std::chrono::seconds validity() const { return m_validity; }
    bool isReleased() const { return m_released; }

    /// @brief Send a request with the session header attached
    /// @throws SyncError if the session was already released
    /// @throws TransportError if no response was received
    http::Response send(http::Request request) const;

    /// Idempotent. Logout failures are logged and otherwise ignored.
    void release() noexcept;

private:
    std::string m_label;
    http::Endpoint m_endpoint;
    std::shared_ptr<http::Client> m_client;
    std::string m_sid;
    std::chrono::seconds m_validity;
    bool m_released = false;
};

class SessionManager {
public:
    explicit SessionManager(std::shared_ptr<http::Client> client);

    /// @brief Log in with the instance's app password
    /// @throws AuthError when the login is refused or the instance is unreachable
    Session acquire(const InstanceConfig& instance) const;

private:
    std::shared_ptr<http::Client> m_client;
};

#endif // SESSION_MANAGER_HPP
