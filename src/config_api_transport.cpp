#include "config_api_transport.hpp"
#include "config_filter.hpp"
#include "json_codec.hpp"
#include "sync_errors.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <thread>

namespace {

constexpr std::size_t ERROR_EXCERPT_LENGTH = 200;

std::optional<std::string> optionalString(const Json::Value& value) {
    if (value.isString()) {
        return value.asString();
    }
    return std::nullopt;
}

Json::Value optionalJson(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

bool isClientError(int status) {
    return status >= 400 && status < 500;
}

} // namespace

Group Group::fromJson(const Json::Value& value) {
    Group group;
    if (value["id"].isIntegral()) {
        group.id = value["id"].asInt();
    }
    group.name = value["name"].asString();
    group.comment = optionalString(value["comment"]);
    group.enabled = value["enabled"].isBool() ? value["enabled"].asBool() : true;
    return group;
}

Json::Value Group::toJson() const {
    Json::Value body(Json::objectValue);
    body["name"] = name;
    body["comment"] = optionalJson(comment);
    body["enabled"] = enabled;
    return body;
}

AdList AdList::fromJson(const Json::Value& value) {
    AdList list;
    if (value["id"].isIntegral()) {
        list.id = value["id"].asInt();
    }
    list.address = value["address"].asString();
    if (value["type"].isString()) {
        list.type = value["type"].asString();
    }
    list.comment = optionalString(value["comment"]);
    list.enabled = value["enabled"].isBool() ? value["enabled"].asBool() : true;
    for (const auto& id : value["groups"]) {
        if (id.isIntegral()) {
            list.groups.push_back(id.asInt());
        }
    }
    return list;
}

Json::Value AdList::toJson() const {
    Json::Value body(Json::objectValue);
    body["address"] = address;
    body["type"] = type;
    body["comment"] = optionalJson(comment);
    body["enabled"] = enabled;
    Json::Value ids(Json::arrayValue);
    for (int id : groups) {
        ids.append(id);
    }
    body["groups"] = ids;
    return body;
}

std::string describeApiError(const http::Response& response) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    const auto& body = response.body;
    if (reader->parse(body.data(), body.data() + body.size(), &root, &errors) &&
        root.isObject() && root["error"].isObject()) {
        const Json::Value& error = root["error"];
        std::string description = error["key"].asString();
        if (error["message"].isString()) {
            description += (description.empty() ? "" : ": ") + error["message"].asString();
        }
        if (error["hint"].isString()) {
            description += " (" + error["hint"].asString() + ")";
        }
        if (!description.empty()) {
            return description;
        }
    }
    if (body.size() > ERROR_EXCERPT_LENGTH) {
        return "HTTP " + std::to_string(response.status) + ": " + body.substr(0, ERROR_EXCERPT_LENGTH) + "...";
    }
    return "HTTP " + std::to_string(response.status) + (body.empty() ? "" : ": " + body);
}

ConfigApiTransport::ConfigApiTransport(std::chrono::milliseconds writeThrottle) : m_writeThrottle(writeThrottle) {}

Json::Value ConfigApiTransport::fetchConfig(const Session& session) const {
    const auto response = session.send(http::Request{http::Method::GET, "/api/config", {}, {}, {}});
    expectSuccess(session, response, "GET /api/config");
    const std::string context = "[" + session.label() + "] GET /api/config";
    return json::member(json::parse(response.body, context), "config", Json::objectValue, context);
}

std::vector<Group> ConfigApiTransport::fetchGroups(const Session& session) const {
    const auto response = session.send(http::Request{http::Method::GET, "/api/groups", {}, {}, {}});
    expectSuccess(session, response, "GET /api/groups");
    const std::string context = "[" + session.label() + "] GET /api/groups";
    const auto root = json::parse(response.body, context);

    std::vector<Group> groups;
    for (const auto& entry : json::member(root, "groups", Json::arrayValue, context)) {
        if (entry.isObject()) {
            groups.push_back(Group::fromJson(entry));
        }
    }
    return groups;
}

std::vector<AdList> ConfigApiTransport::fetchLists(const Session& session) const {
    const auto response = session.send(http::Request{http::Method::GET, "/api/lists", {}, {}, {}});
    expectSuccess(session, response, "GET /api/lists");
    const std::string context = "[" + session.label() + "] GET /api/lists";
    const auto root = json::parse(response.body, context);

    std::vector<AdList> lists;
    for (const auto& entry : json::member(root, "lists", Json::arrayValue, context)) {
        if (entry.isObject()) {
            lists.push_back(AdList::fromJson(entry));
        }
    }
    return lists;
}

PushResult ConfigApiTransport::pushConfig(const Session& session, const Json::Value& tree) const {
    PushResult result;
    const auto leaves = flattenConfig(tree);
    if (leaves.empty()) {
        spdlog::debug("[{}] nothing to push", session.label());
        return result;
    }

    Json::Value batch(Json::objectValue);
    batch["config"] = tree;
    const auto response = write(session, http::Method::PATCH, "/api/config", batch);
    if (response.ok()) {
        for (const auto& leaf : leaves) {
            result.appliedKeys.push_back(leaf.first);
        }
        spdlog::info("[{}] config updated ({} keys)", session.label(), result.appliedKeys.size());
        return result;
    }
    if (!isClientError(response.status)) {
        throw TransportError("[" + session.label() + "] PATCH /api/config failed: " + describeApiError(response),
                             response.status);
    }

    spdlog::warn("[{}] batched config update rejected ({}), retrying key by key",
                 session.label(), describeApiError(response));

    for (const auto& [path, value] : leaves) {
        Json::Value single(Json::objectValue);
        single["config"] = expandPath(path, value);
        const auto keyResponse = write(session, http::Method::PATCH, "/api/config", single);
        if (keyResponse.ok()) {
            result.appliedKeys.push_back(path);
        } else if (isClientError(keyResponse.status)) {
            result.rejectedKeys[path] = describeApiError(keyResponse);
            spdlog::warn("[{}] config key {} rejected: {}", session.label(), path, result.rejectedKeys[path]);
        } else {
            throw TransportError("[" + session.label() + "] PATCH /api/config (" + path + ") failed: " +
                                 describeApiError(keyResponse), keyResponse.status);
        }
    }

    if (result.appliedKeys.empty()) {
        throw TransportError("[" + session.label() + "] every config key was rejected, first: " +
                             result.rejectedKeys.begin()->first + ": " + result.rejectedKeys.begin()->second,
                             response.status);
    }
    return result;
}

void ConfigApiTransport::addGroup(const Session& session, const Group& group) const {
    const auto response = write(session, http::Method::POST, "/api/groups", group.toJson());
    expectSuccess(session, response, "POST /api/groups (" + group.name + ")");
    spdlog::info("[{}] added group '{}'", session.label(), group.name);
}

void ConfigApiTransport::updateGroup(const Session& session, const std::string& name, const Group& group) const {
    const auto response = write(session, http::Method::PUT, "/api/groups/" + http::urlEncode(name), group.toJson());
    expectSuccess(session, response, "PUT /api/groups/" + name);
    spdlog::info("[{}] updated group '{}'", session.label(), name);
}

void ConfigApiTransport::addList(const Session& session, const AdList& list) const {
    const auto response = write(session, http::Method::POST, "/api/lists?type=" + http::urlEncode(list.type),
                                list.toJson());
    expectSuccess(session, response, "POST /api/lists (" + list.address + ")");
    spdlog::info("[{}] added {} list {}", session.label(), list.type, list.address);
}

void ConfigApiTransport::updateList(const Session& session, const AdList& list) const {
    const auto response = write(session, http::Method::PUT,
                                "/api/lists/" + http::urlEncode(list.address) + "?type=" + http::urlEncode(list.type),
                                list.toJson());
    expectSuccess(session, response, "PUT /api/lists/" + list.address);
    spdlog::info("[{}] updated {} list {}", session.label(), list.type, list.address);
}

void ConfigApiTransport::updateGravity(const Session& session) const {
    const auto response = session.send(http::Request{http::Method::POST, "/api/action/gravity", {}, {}, {}});
    expectSuccess(session, response, "POST /api/action/gravity");
    spdlog::info("[{}] gravity update triggered", session.label());
}

http::Response ConfigApiTransport::write(const Session& session, http::Method method, const std::string& target,
                                         const Json::Value& body) const {
    http::Request request;
    request.method = method;
    request.target = target;
    request.contentType = "application/json";
    request.body = json::write(body);
    auto response = session.send(request);
    throttle();
    return response;
}

void ConfigApiTransport::expectSuccess(const Session& session, const http::Response& response,
                                       const std::string& operation) const {
    if (!response.ok()) {
        throw TransportError("[" + session.label() + "] " + operation + " failed: " + describeApiError(response),
                             response.status);
    }
}

void ConfigApiTransport::throttle() const {
    if (m_writeThrottle.count() > 0) {
        std::this_thread::sleep_for(m_writeThrottle);
    }
}
