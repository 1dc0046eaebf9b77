#ifndef CONFIG_API_TRANSPORT_HPP
#define CONFIG_API_TRANSPORT_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "session_manager.hpp"

/// Pi-hole group, matched across instances by name
struct Group {
    std::optional<int> id;
    std::string name;
    std::optional<std::string> comment;
    bool enabled = true;

    static Group fromJson(const Json::Value& value);
    /// Request body for POST /groups and PUT /groups/{name}
    Json::Value toJson() const;
};

/// Pi-hole adlist, matched across instances by (address, type)
struct AdList {
    std::optional<int> id;
    std::string address;
    std::string type = "block";
    std::optional<std::string> comment;
    bool enabled = true;
    std::vector<int> groups;

    static AdList fromJson(const Json::Value& value);
    /// Request body for POST /lists and PUT /lists/{address}
    Json::Value toJson() const;
};

/// Outcome of a config push. Degraded when some keys were rejected.
struct PushResult {
    std::vector<std::string> appliedKeys;
    std::map<std::string, std::string> rejectedKeys;  // key path -> reason

    bool degraded() const { return !rejectedKeys.empty(); }
};

/// Scoped reads from main and writes to a secondary through the REST API.
/// Every write is followed by the configured throttle delay.
class ConfigApiTransport {
public:
    explicit ConfigApiTransport(std::chrono::milliseconds writeThrottle = std::chrono::milliseconds(250));

    /// The `config` member of GET /api/config
    Json::Value fetchConfig(const Session& session) const;
    std::vector<Group> fetchGroups(const Session& session) const;
    std::vector<AdList> fetchLists(const Session& session) const;

    /// @brief Write a config tree to a secondary
    ///
    /// Sends one batched PATCH. When the batch is rejected with a 4xx every
    /// leaf is retried on its own so that the offending keys can be reported.
    /// @throws TransportError when nothing could be applied
    PushResult pushConfig(const Session& session, const Json::Value& tree) const;

    void addGroup(const Session& session, const Group& group) const;
    void updateGroup(const Session& session, const std::string& name, const Group& group) const;
    void addList(const Session& session, const AdList& list) const;
    void updateList(const Session& session, const AdList& list) const;

    /// POST /api/action/gravity
    void updateGravity(const Session& session) const;

private:
    http::Response write(const Session& session, http::Method method, const std::string& target,
                         const Json::Value& body) const;
    void expectSuccess(const Session& session, const http::Response& response, const std::string& operation) const;
    void throttle() const;

    std::chrono::milliseconds m_writeThrottle;
};

/// "key: message (hint)" from a Pi-hole error body, or a body excerpt
std::string describeApiError(const http::Response& response);

#endif // CONFIG_API_TRANSPORT_HPP
